#include "priors/PriorTable.h"

#include "utils/errors.h"
#include "whitelist/WhitelistIndex.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <iterator>
#include <numeric>
#include <stdexcept>
#include <string>
#include <utility>

namespace bcfix::priors {

PriorTable::PriorTable(std::vector<double> priors, bool uniform)
        : m_priors(std::move(priors)), m_uniform(uniform) {
    m_log_priors.reserve(m_priors.size());
    std::transform(m_priors.cbegin(), m_priors.cend(), std::back_inserter(m_log_priors),
                   [](double p) { return std::log(p); });
}

PriorTable PriorTable::uniform(std::size_t size) {
    if (size == 0) {
        throw std::invalid_argument("Cannot build a prior table over an empty whitelist.");
    }
    return PriorTable(std::vector<double>(size, 1.0 / static_cast<double>(size)), true);
}

double PriorTable::prior(const whitelist::WhitelistIndex& index,
                         std::string_view barcode) const {
    if (index.size() != m_priors.size()) {
        throw std::invalid_argument("Prior table holds " + std::to_string(m_priors.size()) +
                                    " entries but the whitelist holds " +
                                    std::to_string(index.size()));
    }
    const auto entry = index.find_exact(barcode);
    if (!entry) {
        throw InputError("Barcode '" + std::string(barcode) +
                         "' is not a member of the whitelist.");
    }
    return m_priors[*entry];
}

PriorAccumulator::PriorAccumulator(const whitelist::WhitelistIndex& index)
        : m_index(index), m_counts(index.size(), 0) {}

void PriorAccumulator::accumulate(std::string_view exact_match) {
    const auto index = m_index.find_exact(exact_match);
    if (!index) {
        throw InputError("Barcode '" + std::string(exact_match) +
                         "' is not a member of the whitelist.");
    }
    accumulate(*index);
}

void PriorAccumulator::accumulate(uint32_t index, uint64_t count) {
    m_counts.at(index) += count;
    m_total += count;
}

void PriorAccumulator::merge(const PriorAccumulator& other) {
    if (&other.m_index != &m_index) {
        throw std::invalid_argument("Cannot merge prior tallies built over different whitelists.");
    }
    for (std::size_t i = 0; i < m_counts.size(); ++i) {
        m_counts[i] += other.m_counts[i];
    }
    m_total += other.m_total;
}

PriorTable PriorAccumulator::finalize(double prior_floor) const {
    if (m_total == 0) {
        spdlog::debug("No exact matches counted, using uniform priors.");
        return PriorTable::uniform(m_counts.size());
    }

    std::vector<double> priors(m_counts.size());
    const double total = static_cast<double>(m_total);
    std::transform(m_counts.cbegin(), m_counts.cend(), priors.begin(), [&](uint64_t count) {
        return std::max(static_cast<double>(count) / total, prior_floor);
    });
    const double sum = std::accumulate(priors.cbegin(), priors.cend(), 0.0);
    for (auto& p : priors) {
        p /= sum;
    }

    const auto num_observed =
            std::count_if(m_counts.cbegin(), m_counts.cend(), [](uint64_t c) { return c > 0; });
    spdlog::debug("Priors built from {} exact matches over {} of {} whitelist barcodes.", m_total,
                  num_observed, m_counts.size());
    return PriorTable(std::move(priors), false);
}

}  // namespace bcfix::priors
