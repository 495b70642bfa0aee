#pragma once

#include <cstdint>

namespace bcfix::pipeline {

struct ReadResult;

struct ProcessingStats {
    uint64_t total{0};
    uint64_t exact{0};
    uint64_t corrected{0};
    uint64_t ambiguous{0};
    uint64_t rejected{0};
    uint64_t not_found{0};
    uint64_t invalid{0};
    uint64_t forward{0};
    uint64_t reverse_complement{0};

    uint64_t matched_before_correction() const { return exact; }
    uint64_t matched_after_correction() const { return exact + corrected; }

    void add(const ReadResult& result);
    ProcessingStats& operator+=(const ProcessingStats& other);
};

}  // namespace bcfix::pipeline
