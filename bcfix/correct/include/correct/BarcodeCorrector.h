#pragma once

#include "config/CorrectionConfig.h"
#include "correct/CorrectionDecision.h"

#include <string_view>

namespace bcfix::whitelist {
class WhitelistIndex;
}

namespace bcfix::priors {
class PriorTable;
}

namespace bcfix::correct {

class CorrectionCache;
class QualityProfile;

/**
 * Decides whether a raw barcode should be assigned to a whitelist entry.
 *
 * Candidates are the whitelist entries within one substitution of the raw barcode. Each candidate
 * w is scored by the likelihood of observing the raw barcode given w, using the per-base error
 * probabilities: a matching base contributes (1 - e), a mismatch e / 3 and an N the configured
 * any-base likelihood. Likelihoods are weighted by the candidate priors and normalised over the
 * candidate set to give posteriors.
 *
 * The corrector holds references to the index and priors, which must outlive it, and is safe to
 * use from several threads at once.
 */
class BarcodeCorrector {
public:
    // Throws ConfigurationError if the configuration is invalid or the prior table does not
    // match the whitelist.
    BarcodeCorrector(const whitelist::WhitelistIndex& index,
                     const priors::PriorTable& priors,
                     const config::CorrectionConfig& config);

    // Throws InputError if the barcode or quality profile is not of the whitelist length.
    CorrectionDecision correct(std::string_view raw, const QualityProfile& quality) const;

    // As above, with a Phred+33 quality string. Non-exact decisions are memoised in the cache
    // when one is given.
    CorrectionDecision correct(std::string_view raw,
                               std::string_view qstring,
                               CorrectionCache* cache) const;

    const whitelist::WhitelistIndex& index() const { return m_index; }
    const config::CorrectionConfig& config() const { return m_config; }

private:
    const whitelist::WhitelistIndex& m_index;
    const priors::PriorTable& m_priors;
    const config::CorrectionConfig m_config;
    const double m_log_any_base_likelihood;
};

}  // namespace bcfix::correct
