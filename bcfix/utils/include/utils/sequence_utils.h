#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace bcfix::utils {

// Convert a canonical base character (ACGT) to an integer representation (0123).
// No checking is performed on the input.
inline int base_to_int(char c) { return 0b11 & ((c >> 2) ^ (c >> 1)); }

// Inverse of base_to_int.
inline char int_to_base(int code) { return "ACGT"[code & 0b11]; }

inline bool is_canonical_base(char c) { return c == 'A' || c == 'C' || c == 'G' || c == 'T'; }

// Upper-cases the sequence and maps every character outside {A,C,G,T} to 'N'.
std::string normalize_bases(std::string_view sequence);

// Number of 'N' characters in the sequence.
std::size_t count_ambiguous_bases(std::string_view sequence);

// Compute reverse complement of a nucleotide sequence.
// Case is preserved and IUPAC ambiguity codes are complemented. Any other character becomes 'N'.
std::string reverse_complement(std::string_view sequence);

// Number of positions at which two equal-length sequences differ.
// Positions holding 'N' in either sequence are not counted.
int hamming_distance_ignoring_n(std::string_view lhs, std::string_view rhs);

// Compile-time constant lookup table.
static constexpr auto complement_table = [] {
    std::array<char, 256> a{};
    a.fill('N');
    constexpr std::string_view bases = "ACGTRYKMSWBDHVN";
    constexpr std::string_view complements = "TGCAYRMKSWVHDBN";
    for (std::size_t i = 0; i < bases.size(); ++i) {
        const char upper = bases[i];
        const char lower = static_cast<char>(upper - 'A' + 'a');
        a[static_cast<unsigned char>(upper)] = complements[i];
        a[static_cast<unsigned char>(lower)] = static_cast<char>(complements[i] - 'A' + 'a');
    }
    return a;
}();

}  // namespace bcfix::utils
