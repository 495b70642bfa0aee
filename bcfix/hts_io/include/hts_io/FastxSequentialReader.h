#pragma once

#include "utils/ReadRecord.h"

#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>

namespace bcfix::hts_io {

// Sequential FASTA/FASTQ reader, plain or gzipped. "-" reads from stdin.
class FastxSequentialReader {
    struct Data;
    std::unique_ptr<Data> data_;
    std::string path_;
    uint64_t num_records_{0};

public:
    explicit FastxSequentialReader(const std::filesystem::path& fastx_path);

    ~FastxSequentialReader();

    // Returns false at the end of the input. Throws std::runtime_error on a malformed record.
    bool get_next(utils::ReadRecord& record);

    uint64_t num_records() const { return num_records_; }
};

}  // namespace bcfix::hts_io
