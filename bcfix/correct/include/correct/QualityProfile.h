#pragma once

#include <cstddef>
#include <string_view>
#include <utility>
#include <vector>

namespace bcfix::correct {

// Per-base error probabilities of a barcode. Immutable once built.
class QualityProfile {
public:
    static constexpr int PHRED_OFFSET = 33;

    // Phred+33 quality string. Throws InputError for characters below '!'.
    static QualityProfile from_phred(std::string_view qstring);

    // Throws InputError for values outside [0, 1].
    static QualityProfile from_error_probabilities(std::vector<double> error_probabilities);

    std::size_t size() const { return m_error_probabilities.size(); }
    double error_probability(std::size_t pos) const { return m_error_probabilities[pos]; }
    const std::vector<double>& error_probabilities() const { return m_error_probabilities; }

private:
    explicit QualityProfile(std::vector<double> error_probabilities)
            : m_error_probabilities(std::move(error_probabilities)) {}

    std::vector<double> m_error_probabilities;
};

}  // namespace bcfix::correct
