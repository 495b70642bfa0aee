#include "correct/QualityProfile.h"

#include "utils/errors.h"

#include <array>
#include <cmath>
#include <string>

namespace bcfix::correct {

namespace {

constexpr int MAX_PHRED_SCORE = 126 - QualityProfile::PHRED_OFFSET;

const std::array<double, MAX_PHRED_SCORE + 1>& phred_error_table() {
    static const auto table = [] {
        std::array<double, MAX_PHRED_SCORE + 1> t{};
        for (int q = 0; q <= MAX_PHRED_SCORE; ++q) {
            t[q] = std::pow(10.0, -q / 10.0);
        }
        return t;
    }();
    return table;
}

}  // namespace

QualityProfile QualityProfile::from_phred(std::string_view qstring) {
    const auto& table = phred_error_table();
    std::vector<double> error_probabilities;
    error_probabilities.reserve(qstring.size());
    for (const char c : qstring) {
        const int q = static_cast<unsigned char>(c) - PHRED_OFFSET;
        if (q < 0 || q > MAX_PHRED_SCORE) {
            throw InputError("Invalid quality character '" + std::string(1, c) +
                             "' in quality string '" + std::string(qstring) + "'");
        }
        error_probabilities.push_back(table[q]);
    }
    return QualityProfile(std::move(error_probabilities));
}

QualityProfile QualityProfile::from_error_probabilities(std::vector<double> error_probabilities) {
    for (const double p : error_probabilities) {
        if (!(p >= 0.0 && p <= 1.0)) {
            throw InputError("Error probability out of range [0, 1]: " + std::to_string(p));
        }
    }
    return QualityProfile(std::move(error_probabilities));
}

}  // namespace bcfix::correct
