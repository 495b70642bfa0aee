#include "locate/BarcodeLocator.h"

#include "utils/errors.h"
#include "utils/sequence_utils.h"
#include "whitelist/WhitelistIndex.h"

#include <algorithm>
#include <cstdlib>
#include <numeric>
#include <optional>
#include <string>
#include <tuple>
#include <utility>

namespace bcfix::locate {

std::string_view to_string(Orientation orientation) {
    return orientation == Orientation::forward ? "forward" : "reverse_complement";
}

BarcodeLocator::BarcodeLocator(const whitelist::WhitelistIndex& index,
                               config::LocatorConfig config)
        : m_index(index), m_config(std::move(config)) {
    const auto& offsets = m_config.allowed_offsets;
    if (std::any_of(offsets.cbegin(), offsets.cend(), [](int o) { return o < 0; })) {
        throw ConfigurationError("Locator offsets must not be negative.");
    }
}

std::vector<int> BarcodeLocator::candidate_offsets(int read_length) const {
    const int last_offset = read_length - m_index.barcode_length();
    std::vector<int> offsets;
    if (m_config.allowed_offsets.empty()) {
        offsets.resize(last_offset + 1);
        std::iota(offsets.begin(), offsets.end(), 0);
        return offsets;
    }
    for (const int offset : m_config.allowed_offsets) {
        if (offset <= last_offset) {
            offsets.push_back(offset);
        }
    }
    return offsets;
}

bool BarcodeLocator::is_better(const Hit& lhs, const Hit& rhs) const {
    const auto rank = [this](const Hit& hit) {
        const int distance_to_hint =
                m_config.expected_offset ? std::abs(hit.offset - *m_config.expected_offset) : 0;
        const Orientation preferred =
                m_config.prefer_forward ? Orientation::forward : Orientation::reverse_complement;
        return std::make_tuple(hit.distance, distance_to_hint, hit.orientation != preferred,
                               hit.offset);
    };
    return rank(lhs) < rank(rhs);
}

OrientationDecision BarcodeLocator::locate(std::string_view sequence,
                                           std::string_view qstring) const {
    if (!qstring.empty() && qstring.size() != sequence.size()) {
        throw InputError("Quality string length " + std::to_string(qstring.size()) +
                         " does not match sequence length " + std::to_string(sequence.size()));
    }

    const int length = m_index.barcode_length();
    if (static_cast<int>(sequence.size()) < length) {
        return {};
    }

    const auto offsets = candidate_offsets(static_cast<int>(sequence.size()));
    std::vector<std::string> forward_windows;
    std::vector<std::string> reverse_windows;
    forward_windows.reserve(offsets.size());
    reverse_windows.reserve(offsets.size());
    for (const int offset : offsets) {
        forward_windows.push_back(utils::normalize_bases(sequence.substr(offset, length)));
        reverse_windows.push_back(utils::reverse_complement(forward_windows.back()));
    }

    std::optional<Hit> best;
    const auto consider = [&](const Hit& hit) {
        if (!best || is_better(hit, *best)) {
            best = hit;
        }
    };

    // Exact hits outrank every distance-1 hit, so neighbours are only searched without one.
    for (std::size_t i = 0; i < offsets.size(); ++i) {
        if (m_index.find_exact(forward_windows[i])) {
            consider({offsets[i], Orientation::forward, 0});
        }
        if (m_index.find_exact(reverse_windows[i])) {
            consider({offsets[i], Orientation::reverse_complement, 0});
        }
    }
    if (!best) {
        for (std::size_t i = 0; i < offsets.size(); ++i) {
            if (utils::count_ambiguous_bases(forward_windows[i]) + 1 >= std::size_t(length)) {
                continue;
            }
            if (!m_index.lookup(forward_windows[i]).empty()) {
                consider({offsets[i], Orientation::forward, 1});
            }
            if (!m_index.lookup(reverse_windows[i]).empty()) {
                consider({offsets[i], Orientation::reverse_complement, 1});
            }
        }
    }
    if (!best) {
        return {};
    }

    OrientationDecision decision;
    decision.found = true;
    decision.orientation = best->orientation;
    decision.offset = best->offset;
    decision.distance = best->distance;
    const auto window_index = static_cast<std::size_t>(
            std::find(offsets.cbegin(), offsets.cend(), best->offset) - offsets.cbegin());
    const auto raw_window = sequence.substr(best->offset, length);
    if (best->orientation == Orientation::forward) {
        decision.barcode = forward_windows[window_index];
        decision.raw_barcode = std::string(raw_window);
    } else {
        decision.barcode = reverse_windows[window_index];
        decision.raw_barcode = utils::reverse_complement(raw_window);
    }
    if (!qstring.empty()) {
        decision.qstring = std::string(qstring.substr(best->offset, length));
        if (best->orientation == Orientation::reverse_complement) {
            std::reverse(decision.qstring.begin(), decision.qstring.end());
        }
    }
    return decision;
}

}  // namespace bcfix::locate
