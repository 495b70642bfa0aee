#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>
#include <vector>

namespace bcfix::whitelist {
class WhitelistIndex;
}

namespace bcfix::priors {

// Frozen prior probability of each whitelist entry, indexed like the whitelist.
class PriorTable {
public:
    // Every entry gets 1/n.
    static PriorTable uniform(std::size_t size);

    std::size_t size() const { return m_priors.size(); }
    double prior(uint32_t index) const { return m_priors.at(index); }
    double log_prior(uint32_t index) const { return m_log_priors.at(index); }
    // Prior of a barcode looked up in the whitelist the table was built over.
    // Throws InputError if the barcode is not a member.
    double prior(const whitelist::WhitelistIndex& index, std::string_view barcode) const;
    bool is_uniform() const { return m_uniform; }

private:
    friend class PriorAccumulator;

    PriorTable(std::vector<double> priors, bool uniform);

    std::vector<double> m_priors;
    std::vector<double> m_log_priors;
    bool m_uniform{true};
};

// Exact-match tallies gathered during the counting pass. Each worker owns one accumulator; the
// partial tallies are merged once the pass is complete and then frozen into a PriorTable.
class PriorAccumulator {
public:
    explicit PriorAccumulator(const whitelist::WhitelistIndex& index);

    // Count one read whose barcode matched the whitelist exactly.
    // Throws InputError if the barcode is not a whitelist member.
    void accumulate(std::string_view exact_match);
    void accumulate(uint32_t index, uint64_t count = 1);

    void merge(const PriorAccumulator& other);

    // p_i proportional to max(count_i / total, prior_floor), normalised to sum to 1.
    // Uniform if nothing was counted.
    PriorTable finalize(double prior_floor) const;

    uint64_t total() const { return m_total; }
    uint64_t count(uint32_t index) const { return m_counts.at(index); }
    const std::vector<uint64_t>& counts() const { return m_counts; }

private:
    const whitelist::WhitelistIndex& m_index;
    std::vector<uint64_t> m_counts;
    uint64_t m_total{0};
};

}  // namespace bcfix::priors
