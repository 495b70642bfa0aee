#include "utils/errors.h"
#include "utils/sequence_utils.h"
#include "whitelist/WhitelistIndex.h"

#include <catch2/catch_test_macros.hpp>
#include <catch2/generators/catch_generators.hpp>

#include <random>
#include <string>
#include <vector>

#define TEST_GROUP "[whitelist_index]"

using bcfix::ConfigurationError;
using bcfix::InputError;
using bcfix::whitelist::NeighbourStrategy;
using bcfix::whitelist::WhitelistIndex;

namespace {

const std::vector<std::string> WHITELIST{"AACCGGTT", "AACCGGTA", "TTGGCCAA", "ACGTACGT"};

std::vector<uint32_t> brute_force_lookup(const WhitelistIndex& index, const std::string& query) {
    std::vector<uint32_t> result;
    for (uint32_t i = 0; i < index.size(); ++i) {
        if (bcfix::utils::hamming_distance_ignoring_n(query, index.barcode(i)) <= 1) {
            result.push_back(i);
        }
    }
    return result;
}

std::string random_barcode(std::mt19937& gen, int length) {
    std::uniform_int_distribution<int> base(0, 3);
    std::string barcode(length, 'A');
    for (auto& c : barcode) {
        c = bcfix::utils::int_to_base(base(gen));
    }
    return barcode;
}

}  // namespace

CATCH_TEST_CASE("WhitelistIndex: exact and single substitution lookups", TEST_GROUP) {
    auto strategy = GENERATE(NeighbourStrategy::precomputed, NeighbourStrategy::enumerate_query);
    const WhitelistIndex index(WHITELIST, 4096, strategy);

    CATCH_CHECK(index.size() == 4);
    CATCH_CHECK(index.barcode_length() == 8);

    CATCH_SECTION("Whitelist member returns itself and its neighbours") {
        CATCH_CHECK(index.lookup("AACCGGTT") == std::vector<uint32_t>{0, 1});
        CATCH_CHECK(index.lookup("ACGTACGT") == std::vector<uint32_t>{3});
    }

    CATCH_SECTION("Distance one from two entries") {
        CATCH_CHECK(index.lookup("AACCGGTC") == std::vector<uint32_t>{0, 1});
    }

    CATCH_SECTION("Distance one from a single entry") {
        CATCH_CHECK(index.lookup("TTGGCCAT") == std::vector<uint32_t>{2});
    }

    CATCH_SECTION("Nothing within distance one") {
        CATCH_CHECK(index.lookup("TTTTTTTT").empty());
        CATCH_CHECK(index.lookup("AACCTTAA").empty());
    }

    CATCH_SECTION("Exact match") {
        CATCH_CHECK(index.find_exact("TTGGCCAA") == 2u);
        CATCH_CHECK_FALSE(index.find_exact("TTGGCCAT").has_value());
        CATCH_CHECK_FALSE(index.find_exact("TTGGCCAN").has_value());
    }
}

CATCH_TEST_CASE("WhitelistIndex: ambiguous bases are wildcards", TEST_GROUP) {
    const WhitelistIndex index(WHITELIST);

    CATCH_CHECK(index.lookup("AACCGGTN") == std::vector<uint32_t>{0, 1});
    CATCH_CHECK(index.lookup("NACCGGTC") == std::vector<uint32_t>{0, 1});
    CATCH_CHECK(index.lookup("TTGGNNAA") == std::vector<uint32_t>{2});
    // One N plus two mismatches is still too far.
    CATCH_CHECK(index.lookup("NTGGCCTT").empty());
    // Every entry matches a query made only of Ns.
    CATCH_CHECK(index.lookup("NNNNNNNN") == std::vector<uint32_t>{0, 1, 2, 3});
}

CATCH_TEST_CASE("WhitelistIndex: lookups match a brute force scan", TEST_GROUP) {
    auto strategy = GENERATE(NeighbourStrategy::precomputed, NeighbourStrategy::enumerate_query);
    // 1 forces every query with an N through the full scan.
    auto max_n_expansions = GENERATE(std::size_t{1}, std::size_t{4096});
    CATCH_CAPTURE(max_n_expansions);

    std::mt19937 gen(42);
    const int length = 10;
    std::vector<std::string> barcodes;
    for (int i = 0; i < 200; ++i) {
        barcodes.push_back(random_barcode(gen, length));
    }
    const WhitelistIndex index(barcodes, max_n_expansions, strategy);

    std::uniform_int_distribution<int> pick(0, static_cast<int>(index.size()) - 1);
    std::uniform_int_distribution<int> position(0, length - 1);
    std::uniform_int_distribution<int> count(0, 3);
    std::uniform_int_distribution<int> base(0, 3);
    for (int trial = 0; trial < 500; ++trial) {
        std::string query = index.barcode(pick(gen));
        const int num_substitutions = count(gen) % 3;
        for (int i = 0; i < num_substitutions; ++i) {
            query[position(gen)] = bcfix::utils::int_to_base(base(gen));
        }
        const int num_ns = count(gen);
        for (int i = 0; i < num_ns; ++i) {
            query[position(gen)] = 'N';
        }
        CATCH_CAPTURE(query);
        CATCH_CHECK(index.lookup(query) == brute_force_lookup(index, query));
    }
}

CATCH_TEST_CASE("WhitelistIndex: neighbour strategy selection", TEST_GROUP) {
    CATCH_CHECK(WhitelistIndex(WHITELIST).uses_precomputed_neighbours());
    CATCH_CHECK_FALSE(WhitelistIndex(WHITELIST, 4096, NeighbourStrategy::enumerate_query)
                              .uses_precomputed_neighbours());
}

CATCH_TEST_CASE("WhitelistIndex: input normalisation", TEST_GROUP) {
    const WhitelistIndex index({"aaccggtt", "AACCGGTT", "TTGGCCAA", "ttggccaa"});

    CATCH_CHECK(index.size() == 2);
    CATCH_CHECK(index.barcode(0) == "AACCGGTT");
    CATCH_CHECK(index.barcode(1) == "TTGGCCAA");
}

CATCH_TEST_CASE("WhitelistIndex: invalid whitelists", TEST_GROUP) {
    CATCH_CHECK_THROWS_AS(WhitelistIndex(std::vector<std::string>{}), ConfigurationError);
    CATCH_CHECK_THROWS_AS(WhitelistIndex({"AACCGGTT", "AACCGG"}), ConfigurationError);
    CATCH_CHECK_THROWS_AS(WhitelistIndex({"AACCGGTN"}), ConfigurationError);
    CATCH_CHECK_THROWS_AS(WhitelistIndex({""}), ConfigurationError);
    CATCH_CHECK_THROWS_AS(WhitelistIndex({std::string(33, 'A')}), ConfigurationError);
    CATCH_CHECK_NOTHROW(WhitelistIndex({std::string(32, 'A')}));
}

CATCH_TEST_CASE("WhitelistIndex: queries of the wrong length", TEST_GROUP) {
    const WhitelistIndex index(WHITELIST);

    CATCH_CHECK_THROWS_AS(index.lookup("AACCGGT"), InputError);
    CATCH_CHECK_THROWS_AS(index.lookup("AACCGGTTA"), InputError);
    CATCH_CHECK_THROWS_AS(index.find_exact(""), InputError);
}
