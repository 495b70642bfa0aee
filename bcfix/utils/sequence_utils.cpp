#include "utils/sequence_utils.h"

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace bcfix::utils {

std::string normalize_bases(std::string_view sequence) {
    std::string result(sequence);
    for (auto& c : result) {
        c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
        if (!is_canonical_base(c)) {
            c = 'N';
        }
    }
    return result;
}

std::size_t count_ambiguous_bases(std::string_view sequence) {
    return static_cast<std::size_t>(std::count(sequence.begin(), sequence.end(), 'N'));
}

std::string reverse_complement(std::string_view sequence) {
    if (sequence.empty()) {
        return {};
    }

    const auto num_bases = sequence.size();
    std::string rev_comp_sequence;
    rev_comp_sequence.resize(num_bases);

    // Run every template base through the table, reading in reverse order.
    const char* template_ptr = &sequence[num_bases - 1];
    char* complement_ptr = &rev_comp_sequence[0];
    for (size_t i = 0; i < num_bases; ++i) {
        const auto template_base = static_cast<unsigned char>(*template_ptr--);
        *complement_ptr++ = complement_table[template_base];
    }
    return rev_comp_sequence;
}

int hamming_distance_ignoring_n(std::string_view lhs, std::string_view rhs) {
    if (lhs.size() != rhs.size()) {
        throw std::invalid_argument("Hamming distance requires sequences of equal length.");
    }
    int distance = 0;
    for (size_t i = 0; i < lhs.size(); ++i) {
        if (lhs[i] != rhs[i] && lhs[i] != 'N' && rhs[i] != 'N') {
            ++distance;
        }
    }
    return distance;
}

}  // namespace bcfix::utils
