#include "whitelist/WhitelistIndex.h"

#include "utils/errors.h"
#include "utils/sequence_utils.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <string>

namespace bcfix::whitelist {

namespace {

// Above this many precomputed variants the neighbour table costs more memory than it saves
// in lookup time, so the automatic strategy switches to enumerating query variants.
constexpr std::size_t MAX_AUTOMATIC_NEIGHBOUR_ENTRIES = 16'000'000;

uint64_t replace_base(uint64_t key, int shift, uint64_t base) {
    return (key & ~(uint64_t{0b11} << shift)) | (base << shift);
}

void sort_and_unique(std::vector<uint32_t>& indices) {
    std::sort(indices.begin(), indices.end());
    indices.erase(std::unique(indices.begin(), indices.end()), indices.end());
}

}  // namespace

WhitelistIndex::WhitelistIndex(const std::vector<std::string>& barcodes,
                               std::size_t max_n_expansions,
                               NeighbourStrategy strategy)
        : m_max_n_expansions(max_n_expansions) {
    if (barcodes.empty()) {
        throw ConfigurationError("Whitelist is empty.");
    }
    if (barcodes.size() >= SHARED_NEIGHBOUR_FLAG) {
        throw ConfigurationError("Whitelist holds too many barcodes: " +
                                 std::to_string(barcodes.size()));
    }

    m_barcode_length = static_cast<int>(barcodes.front().size());
    if (m_barcode_length == 0 || m_barcode_length > MAX_BARCODE_LENGTH) {
        throw ConfigurationError("Whitelist barcode length must be between 1 and " +
                                 std::to_string(MAX_BARCODE_LENGTH) + ", found " +
                                 std::to_string(m_barcode_length));
    }

    m_barcodes.reserve(barcodes.size());
    m_exact.reserve(barcodes.size());
    std::size_t num_duplicates = 0;
    for (const auto& raw_barcode : barcodes) {
        if (static_cast<int>(raw_barcode.size()) != m_barcode_length) {
            throw ConfigurationError("Whitelist barcodes have inconsistent lengths: '" +
                                     raw_barcode + "' is not of length " +
                                     std::to_string(m_barcode_length));
        }
        std::string barcode(raw_barcode);
        for (auto& c : barcode) {
            c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
            if (!utils::is_canonical_base(c)) {
                throw ConfigurationError("Whitelist barcode '" + raw_barcode +
                                         "' contains characters other than A, C, G and T.");
            }
        }
        const auto index = static_cast<uint32_t>(m_barcodes.size());
        if (!m_exact.emplace(pack(barcode), index).second) {
            ++num_duplicates;
            continue;
        }
        m_barcodes.push_back(std::move(barcode));
    }
    if (num_duplicates > 0) {
        spdlog::warn("Collapsed {} duplicate whitelist entries.", num_duplicates);
    }

    const std::size_t num_variants = m_barcodes.size() * 3 * m_barcode_length;
    m_precomputed = strategy == NeighbourStrategy::precomputed ||
                    (strategy == NeighbourStrategy::automatic &&
                     num_variants <= MAX_AUTOMATIC_NEIGHBOUR_ENTRIES);
    if (m_precomputed) {
        build_neighbour_table();
    }

    spdlog::debug("Whitelist index: {} barcodes of length {}, {} neighbour lookup",
                  m_barcodes.size(), m_barcode_length,
                  m_precomputed ? "precomputed" : "per-query");
}

uint64_t WhitelistIndex::pack(std::string_view barcode) const {
    uint64_t key = 0;
    for (const char c : barcode) {
        key = (key << 2) | static_cast<uint64_t>(utils::is_canonical_base(c) ? utils::base_to_int(c)
                                                                              : 0);
    }
    return key;
}

void WhitelistIndex::check_query_length(std::string_view query) const {
    if (static_cast<int>(query.size()) != m_barcode_length) {
        throw InputError("Query '" + std::string(query) + "' has length " +
                         std::to_string(query.size()) + ", expected " +
                         std::to_string(m_barcode_length));
    }
}

void WhitelistIndex::add_neighbour(uint64_t key, uint32_t index) {
    auto [it, inserted] = m_neighbours.emplace(key, index);
    if (inserted || it->second == index) {
        return;
    }
    if (it->second & SHARED_NEIGHBOUR_FLAG) {
        m_shared_neighbours[it->second & ~SHARED_NEIGHBOUR_FLAG].push_back(index);
        return;
    }
    const auto shared_index = static_cast<uint32_t>(m_shared_neighbours.size());
    m_shared_neighbours.push_back({it->second, index});
    it->second = shared_index | SHARED_NEIGHBOUR_FLAG;
}

void WhitelistIndex::build_neighbour_table() {
    m_neighbours.reserve(m_barcodes.size() * 3 * m_barcode_length);
    for (uint32_t index = 0; index < m_barcodes.size(); ++index) {
        const uint64_t key = pack(m_barcodes[index]);
        for (int pos = 0; pos < m_barcode_length; ++pos) {
            const int shift = 2 * (m_barcode_length - 1 - pos);
            const uint64_t original = (key >> shift) & 0b11;
            for (uint64_t base = 0; base < 4; ++base) {
                if (base != original) {
                    add_neighbour(replace_base(key, shift, base), index);
                }
            }
        }
    }
    spdlog::debug("Neighbour table holds {} variants, {} shared by several barcodes",
                  m_neighbours.size(), m_shared_neighbours.size());
}

void WhitelistIndex::collect_canonical(uint64_t key, std::vector<uint32_t>& out) const {
    if (auto it = m_exact.find(key); it != m_exact.end()) {
        out.push_back(it->second);
    }

    if (m_precomputed) {
        auto it = m_neighbours.find(key);
        if (it == m_neighbours.end()) {
            return;
        }
        if (it->second & SHARED_NEIGHBOUR_FLAG) {
            const auto& shared = m_shared_neighbours[it->second & ~SHARED_NEIGHBOUR_FLAG];
            out.insert(out.end(), shared.begin(), shared.end());
        } else {
            out.push_back(it->second);
        }
        return;
    }

    for (int pos = 0; pos < m_barcode_length; ++pos) {
        const int shift = 2 * (m_barcode_length - 1 - pos);
        const uint64_t original = (key >> shift) & 0b11;
        for (uint64_t base = 0; base < 4; ++base) {
            if (base == original) {
                continue;
            }
            if (auto it = m_exact.find(replace_base(key, shift, base)); it != m_exact.end()) {
                out.push_back(it->second);
            }
        }
    }
}

void WhitelistIndex::collect_with_wildcards(std::string_view query,
                                            const std::vector<int>& n_positions,
                                            std::vector<uint32_t>& out) const {
    // Every assignment of bases to the N positions is a canonical query. A whitelist entry is
    // within distance 1 of the wildcard query exactly when it is within distance 1 of the
    // assignment that copies its own bases into the N positions.
    const uint64_t base_key = pack(query);
    const uint64_t num_expansions = uint64_t{1} << (2 * n_positions.size());
    for (uint64_t expansion = 0; expansion < num_expansions; ++expansion) {
        uint64_t key = base_key;
        for (size_t j = 0; j < n_positions.size(); ++j) {
            const int shift = 2 * (m_barcode_length - 1 - n_positions[j]);
            key = replace_base(key, shift, (expansion >> (2 * j)) & 0b11);
        }
        collect_canonical(key, out);
    }
}

void WhitelistIndex::collect_by_scan(std::string_view query, std::vector<uint32_t>& out) const {
    for (uint32_t index = 0; index < m_barcodes.size(); ++index) {
        if (utils::hamming_distance_ignoring_n(query, m_barcodes[index]) <= 1) {
            out.push_back(index);
        }
    }
}

std::optional<uint32_t> WhitelistIndex::find_exact(std::string_view query) const {
    check_query_length(query);
    if (!std::all_of(query.begin(), query.end(), utils::is_canonical_base)) {
        return std::nullopt;
    }
    if (auto it = m_exact.find(pack(query)); it != m_exact.end()) {
        return it->second;
    }
    return std::nullopt;
}

std::vector<uint32_t> WhitelistIndex::lookup(std::string_view query) const {
    check_query_length(query);

    std::vector<int> n_positions;
    for (int pos = 0; pos < m_barcode_length; ++pos) {
        if (!utils::is_canonical_base(query[pos])) {
            n_positions.push_back(pos);
        }
    }

    std::vector<uint32_t> result;
    if (n_positions.empty()) {
        collect_canonical(pack(query), result);
    } else if (n_positions.size() < 32 &&
               (uint64_t{1} << (2 * std::min<size_t>(n_positions.size(), 31))) <=
                       m_max_n_expansions) {
        collect_with_wildcards(query, n_positions, result);
    } else {
        collect_by_scan(utils::normalize_bases(query), result);
    }
    sort_and_unique(result);
    return result;
}

}  // namespace bcfix::whitelist
