#include "pipeline/ProcessingStats.h"

#include "pipeline/BarcodeProcessor.h"

namespace bcfix::pipeline {

void ProcessingStats::add(const ReadResult& result) {
    ++total;
    if (result.invalid_input) {
        ++invalid;
        return;
    }
    if (!result.orientation.found) {
        ++not_found;
        return;
    }

    if (result.orientation.orientation == locate::Orientation::forward) {
        ++forward;
    } else {
        ++reverse_complement;
    }

    switch (result.correction.status) {
    case correct::CorrectionStatus::exact:
        ++exact;
        break;
    case correct::CorrectionStatus::corrected:
        ++corrected;
        break;
    case correct::CorrectionStatus::ambiguous:
        ++ambiguous;
        break;
    case correct::CorrectionStatus::rejected:
        ++rejected;
        break;
    }
}

ProcessingStats& ProcessingStats::operator+=(const ProcessingStats& other) {
    total += other.total;
    exact += other.exact;
    corrected += other.corrected;
    ambiguous += other.ambiguous;
    rejected += other.rejected;
    not_found += other.not_found;
    invalid += other.invalid;
    forward += other.forward;
    reverse_complement += other.reverse_complement;
    return *this;
}

}  // namespace bcfix::pipeline
