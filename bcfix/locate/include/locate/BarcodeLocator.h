#pragma once

#include "config/CorrectionConfig.h"

#include <string>
#include <string_view>
#include <vector>

namespace bcfix::whitelist {
class WhitelistIndex;
}

namespace bcfix::locate {

enum class Orientation {
    forward,
    reverse_complement,
};

std::string_view to_string(Orientation orientation);

struct OrientationDecision {
    bool found{false};
    Orientation orientation{Orientation::forward};
    // Start of the barcode window in read coordinates, for either orientation.
    int offset{-1};
    // 0 for an exact whitelist match, 1 when the window is at most one substitution away.
    int distance{-1};
    // Window contents in whitelist orientation with non-ACGT bases as N, and the quality slice
    // reordered to match.
    std::string barcode;
    std::string qstring;
    // The same window as it appears in the read, reverse complemented for reverse hits.
    std::string raw_barcode;
};

// Finds the window of a read holding a whitelist barcode, in the read's own orientation or as its
// reverse complement. Holds a reference to the index, which must outlive it.
class BarcodeLocator {
public:
    BarcodeLocator(const whitelist::WhitelistIndex& index, config::LocatorConfig config);

    // Windows with fewer than two called bases are never reported as distance 1 hits, since they
    // are within one substitution of every whitelist entry.
    // The quality string may be empty. Throws InputError if it is not, and its length differs
    // from the sequence's.
    OrientationDecision locate(std::string_view sequence, std::string_view qstring = {}) const;

private:
    struct Hit {
        int offset;
        Orientation orientation;
        int distance;
    };

    std::vector<int> candidate_offsets(int read_length) const;
    bool is_better(const Hit& lhs, const Hit& rhs) const;

    const whitelist::WhitelistIndex& m_index;
    const config::LocatorConfig m_config;
};

}  // namespace bcfix::locate
