#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace bcfix::correct {

enum class CorrectionStatus {
    exact,
    corrected,
    ambiguous,
    rejected,
};

enum class RejectReason {
    none,
    no_candidates,
    low_confidence,
    all_ambiguous_bases,
    invalid_input,
};

struct CorrectionDecision {
    CorrectionStatus status{CorrectionStatus::rejected};
    // Whitelist barcode the read is assigned to, set for exact and corrected decisions.
    std::string barcode;
    std::optional<uint32_t> whitelist_index;
    // Posterior of the best candidate (1 for exact matches).
    double confidence{0.0};
    uint32_t num_candidates{0};
    RejectReason reject_reason{RejectReason::none};

    bool is_assigned() const {
        return status == CorrectionStatus::exact || status == CorrectionStatus::corrected;
    }
};

std::string_view to_string(CorrectionStatus status);
std::string_view to_string(RejectReason reason);

}  // namespace bcfix::correct
