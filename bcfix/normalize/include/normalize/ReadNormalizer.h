#pragma once

#include "correct/CorrectionDecision.h"
#include "locate/BarcodeLocator.h"
#include "utils/ReadRecord.h"

#include <string_view>

namespace bcfix::normalize {

// SAM-style tags written to the record comment.
inline constexpr std::string_view RAW_BARCODE_TAG = "CR:Z:";
inline constexpr std::string_view CORRECTED_BARCODE_TAG = "CB:Z:";
inline constexpr std::string_view RAW_QUALITY_TAG = "CY:Z:";

// Rewrites a read as its extracted barcode: the sequence and qualities are the located window in
// whitelist orientation, and the comment carries the raw barcode, its qualities and, for exact or
// corrected decisions, the whitelist barcode. Reads whose barcode was not found are returned
// unchanged so the output stays aligned with companion read files.
utils::ReadRecord normalize_read(const utils::ReadRecord& read,
                                 const locate::OrientationDecision& orientation,
                                 const correct::CorrectionDecision& correction);

}  // namespace bcfix::normalize
