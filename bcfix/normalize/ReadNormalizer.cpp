#include "normalize/ReadNormalizer.h"

namespace bcfix::normalize {

utils::ReadRecord normalize_read(const utils::ReadRecord& read,
                                 const locate::OrientationDecision& orientation,
                                 const correct::CorrectionDecision& correction) {
    if (!orientation.found) {
        return read;
    }

    utils::ReadRecord normalized;
    normalized.id = read.id;
    normalized.sequence = orientation.barcode;
    normalized.qstring = orientation.qstring;

    std::string& tags = normalized.comment;
    tags.append(RAW_BARCODE_TAG).append(orientation.raw_barcode);
    if (correction.is_assigned()) {
        tags.append("\t").append(CORRECTED_BARCODE_TAG).append(correction.barcode);
    }
    tags.append("\t").append(RAW_QUALITY_TAG).append(orientation.qstring);
    return normalized;
}

}  // namespace bcfix::normalize
