#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace bcfix::whitelist {

// How single-substitution neighbours of a query are found.
enum class NeighbourStrategy {
    // Every whitelist entry's 3L substitution variants are hashed up front, so a lookup is a
    // single probe. Memory grows with |whitelist| * 3L.
    precomputed,
    // The query's own 3L substitution variants are probed against the exact-match table.
    // No extra memory, 3L probes per lookup.
    enumerate_query,
    // precomputed for whitelists whose variant table stays below a fixed size, otherwise
    // enumerate_query.
    automatic,
};

// Read-only index over a whitelist of equal-length barcodes answering "which whitelist entries
// are within Hamming distance 1 of this query". Safe to share between threads once built.
//
// Queries are expected in upper case. Any character other than A, C, G or T in a query is an
// ambiguous base (N): it matches every base and is not counted as a mismatch.
class WhitelistIndex {
public:
    static constexpr int MAX_BARCODE_LENGTH = 32;

    // Throws ConfigurationError if the whitelist is empty, the barcodes differ in length, are
    // longer than MAX_BARCODE_LENGTH, or contain characters other than A, C, G and T.
    // Lower-case input is accepted, duplicate entries are collapsed.
    explicit WhitelistIndex(const std::vector<std::string>& barcodes,
                            std::size_t max_n_expansions = 4096,
                            NeighbourStrategy strategy = NeighbourStrategy::automatic);

    std::size_t size() const { return m_barcodes.size(); }
    int barcode_length() const { return m_barcode_length; }
    const std::string& barcode(uint32_t index) const { return m_barcodes.at(index); }
    const std::vector<std::string>& barcodes() const { return m_barcodes; }
    bool uses_precomputed_neighbours() const { return m_precomputed; }

    // Whitelist index of an exact (N-free) match. Throws InputError on a length mismatch.
    std::optional<uint32_t> find_exact(std::string_view query) const;

    // Sorted indices of every whitelist entry at distance 0 or 1 from the query, N positions
    // excluded from the distance. Throws InputError on a length mismatch.
    std::vector<uint32_t> lookup(std::string_view query) const;

private:
    // Set on a neighbour table value when the variant came from several whitelist entries;
    // the remaining bits index m_shared_neighbours.
    static constexpr uint32_t SHARED_NEIGHBOUR_FLAG = 1u << 31;

    std::vector<std::string> m_barcodes;
    int m_barcode_length{0};
    std::size_t m_max_n_expansions;
    bool m_precomputed{false};
    std::unordered_map<uint64_t, uint32_t> m_exact;
    std::unordered_map<uint64_t, uint32_t> m_neighbours;
    std::vector<std::vector<uint32_t>> m_shared_neighbours;

    uint64_t pack(std::string_view barcode) const;
    void check_query_length(std::string_view query) const;
    void add_neighbour(uint64_t key, uint32_t index);
    void build_neighbour_table();
    void collect_canonical(uint64_t key, std::vector<uint32_t>& out) const;
    void collect_with_wildcards(std::string_view query,
                                const std::vector<int>& n_positions,
                                std::vector<uint32_t>& out) const;
    void collect_by_scan(std::string_view query, std::vector<uint32_t>& out) const;
};

}  // namespace bcfix::whitelist
