#include "correct/BarcodeCorrector.h"

#include "correct/CorrectionCache.h"
#include "correct/QualityProfile.h"
#include "priors/PriorTable.h"
#include "utils/errors.h"
#include "utils/sequence_utils.h"
#include "whitelist/WhitelistIndex.h"

#include <algorithm>
#include <cmath>
#include <string>
#include <vector>

namespace bcfix::correct {

namespace {

CorrectionDecision make_rejection(RejectReason reason, uint32_t num_candidates) {
    CorrectionDecision decision;
    decision.status = CorrectionStatus::rejected;
    decision.num_candidates = num_candidates;
    decision.reject_reason = reason;
    return decision;
}

}  // namespace

BarcodeCorrector::BarcodeCorrector(const whitelist::WhitelistIndex& index,
                                   const priors::PriorTable& priors,
                                   const config::CorrectionConfig& config)
        : m_index(index),
          m_priors(priors),
          m_config(config),
          m_log_any_base_likelihood(std::log(config.any_base_likelihood)) {
    config::validate(m_config);
    if (m_priors.size() != m_index.size()) {
        throw ConfigurationError("Prior table holds " + std::to_string(m_priors.size()) +
                                 " entries but the whitelist holds " +
                                 std::to_string(m_index.size()));
    }
}

CorrectionDecision BarcodeCorrector::correct(std::string_view raw,
                                             const QualityProfile& quality) const {
    const auto length = static_cast<std::size_t>(m_index.barcode_length());
    if (raw.size() != length) {
        throw InputError("Barcode '" + std::string(raw) + "' has length " +
                         std::to_string(raw.size()) + ", expected " + std::to_string(length));
    }
    if (quality.size() != length) {
        throw InputError("Quality profile has length " + std::to_string(quality.size()) +
                         ", expected " + std::to_string(length));
    }

    const std::string barcode = utils::normalize_bases(raw);
    if (utils::count_ambiguous_bases(barcode) == length) {
        return make_rejection(RejectReason::all_ambiguous_bases, 0);
    }

    if (const auto exact = m_index.find_exact(barcode)) {
        CorrectionDecision decision;
        decision.status = CorrectionStatus::exact;
        decision.barcode = m_index.barcode(*exact);
        decision.whitelist_index = exact;
        decision.confidence = 1.0;
        decision.num_candidates = 1;
        return decision;
    }

    const auto candidates = m_index.lookup(barcode);
    const auto num_candidates = static_cast<uint32_t>(candidates.size());
    if (candidates.empty()) {
        return make_rejection(RejectReason::no_candidates, 0);
    }

    // Per-position log likelihoods only depend on whether the base matches, so compute them once.
    std::vector<double> log_match(length);
    std::vector<double> log_mismatch(length);
    for (std::size_t i = 0; i < length; ++i) {
        const double e = std::clamp(quality.error_probability(i), m_config.error_floor,
                                    m_config.error_ceiling);
        log_match[i] = std::log1p(-e);
        log_mismatch[i] = std::log(e / 3.0);
    }

    std::vector<double> log_posteriors;
    log_posteriors.reserve(candidates.size());
    for (const uint32_t candidate : candidates) {
        const auto& whitelisted = m_index.barcode(candidate);
        double log_likelihood = 0.0;
        for (std::size_t i = 0; i < length; ++i) {
            if (barcode[i] == 'N') {
                log_likelihood += m_log_any_base_likelihood;
            } else if (barcode[i] == whitelisted[i]) {
                log_likelihood += log_match[i];
            } else {
                log_likelihood += log_mismatch[i];
            }
        }
        log_posteriors.push_back(log_likelihood + m_priors.log_prior(candidate));
    }

    // log-sum-exp normalisation.
    const double max_log = *std::max_element(log_posteriors.cbegin(), log_posteriors.cend());
    double sum = 0.0;
    for (const double lp : log_posteriors) {
        sum += std::exp(lp - max_log);
    }

    std::size_t best = 0;
    double best_posterior = -1.0;
    double second_posterior = 0.0;
    for (std::size_t i = 0; i < log_posteriors.size(); ++i) {
        const double posterior = std::exp(log_posteriors[i] - max_log) / sum;
        if (posterior > best_posterior) {
            second_posterior = std::max(second_posterior, best_posterior);
            best_posterior = posterior;
            best = i;
        } else {
            second_posterior = std::max(second_posterior, posterior);
        }
    }

    if (num_candidates > 1 &&
        (best_posterior - second_posterior) / best_posterior < m_config.ambiguity_margin) {
        CorrectionDecision decision;
        decision.status = CorrectionStatus::ambiguous;
        decision.confidence = best_posterior;
        decision.num_candidates = num_candidates;
        return decision;
    }

    if (best_posterior < m_config.confidence_threshold) {
        auto decision = make_rejection(RejectReason::low_confidence, num_candidates);
        decision.confidence = best_posterior;
        return decision;
    }

    CorrectionDecision decision;
    decision.status = CorrectionStatus::corrected;
    decision.barcode = m_index.barcode(candidates[best]);
    decision.whitelist_index = candidates[best];
    decision.confidence = best_posterior;
    decision.num_candidates = num_candidates;
    return decision;
}

CorrectionDecision BarcodeCorrector::correct(std::string_view raw,
                                             std::string_view qstring,
                                             CorrectionCache* cache) const {
    if (cache) {
        if (const auto* cached = cache->find(raw, qstring)) {
            return *cached;
        }
    }
    auto decision = correct(raw, QualityProfile::from_phred(qstring));
    if (cache && decision.status != CorrectionStatus::exact) {
        cache->insert(raw, qstring, decision);
    }
    return decision;
}

}  // namespace bcfix::correct
