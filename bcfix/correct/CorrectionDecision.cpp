#include "correct/CorrectionDecision.h"

namespace bcfix::correct {

std::string_view to_string(CorrectionStatus status) {
    switch (status) {
    case CorrectionStatus::exact:
        return "exact";
    case CorrectionStatus::corrected:
        return "corrected";
    case CorrectionStatus::ambiguous:
        return "ambiguous";
    case CorrectionStatus::rejected:
        return "rejected";
    }
    return "unknown";
}

std::string_view to_string(RejectReason reason) {
    switch (reason) {
    case RejectReason::none:
        return "none";
    case RejectReason::no_candidates:
        return "no_candidates";
    case RejectReason::low_confidence:
        return "low_confidence";
    case RejectReason::all_ambiguous_bases:
        return "all_ambiguous_bases";
    case RejectReason::invalid_input:
        return "invalid_input";
    }
    return "unknown";
}

}  // namespace bcfix::correct
