#include "config/CorrectionConfig.h"
#include "locate/BarcodeLocator.h"
#include "utils/errors.h"
#include "utils/sequence_utils.h"
#include "whitelist/WhitelistIndex.h"

#include <catch2/catch_test_macros.hpp>

#include <string>

#define TEST_GROUP "[barcode_locator]"

using namespace bcfix;
using locate::BarcodeLocator;
using locate::Orientation;

namespace {

const std::string FLANK = "CCCCC";

const whitelist::WhitelistIndex& test_index() {
    static const whitelist::WhitelistIndex index({"AAACCCGG", "TTGACAGT", "GATTACAC"});
    return index;
}

}  // namespace

CATCH_TEST_CASE("BarcodeLocator: forward barcode at the expected offset", TEST_GROUP) {
    config::LocatorConfig config;
    config.expected_offset = 5;
    const BarcodeLocator locator(test_index(), config);

    const auto decision = locator.locate(FLANK + "TTGACAGT" + FLANK, "!!!!!ABCDEFGH!!!!!");

    CATCH_REQUIRE(decision.found);
    CATCH_CHECK(decision.orientation == Orientation::forward);
    CATCH_CHECK(decision.offset == 5);
    CATCH_CHECK(decision.distance == 0);
    CATCH_CHECK(decision.barcode == "TTGACAGT");
    CATCH_CHECK(decision.qstring == "ABCDEFGH");
}

CATCH_TEST_CASE("BarcodeLocator: reverse complemented barcode", TEST_GROUP) {
    config::LocatorConfig config;
    config.expected_offset = 5;
    const BarcodeLocator locator(test_index(), config);
    const auto read = FLANK + utils::reverse_complement("TTGACAGT") + FLANK;

    const auto decision = locator.locate(read, "!!!!!ABCDEFGH!!!!!");

    CATCH_REQUIRE(decision.found);
    CATCH_CHECK(decision.orientation == Orientation::reverse_complement);
    // Offsets are in read coordinates for both orientations.
    CATCH_CHECK(decision.offset == 5);
    CATCH_CHECK(decision.distance == 0);
    CATCH_CHECK(decision.barcode == "TTGACAGT");
    CATCH_CHECK(decision.qstring == "HGFEDCBA");
}

CATCH_TEST_CASE("BarcodeLocator: single substitution", TEST_GROUP) {
    const BarcodeLocator locator(test_index(), {});

    const auto decision = locator.locate(FLANK + "TTGACAGA" + FLANK);

    CATCH_REQUIRE(decision.found);
    CATCH_CHECK(decision.orientation == Orientation::forward);
    CATCH_CHECK(decision.offset == 5);
    CATCH_CHECK(decision.distance == 1);
    CATCH_CHECK(decision.barcode == "TTGACAGA");
    CATCH_CHECK(decision.qstring.empty());
}

CATCH_TEST_CASE("BarcodeLocator: not found", TEST_GROUP) {
    const BarcodeLocator locator(test_index(), {});

    CATCH_CHECK_FALSE(locator.locate(std::string(18, 'C')).found);
    CATCH_CHECK_FALSE(locator.locate("TTGACAG").found);
    CATCH_CHECK_FALSE(locator.locate("").found);
    CATCH_CHECK_FALSE(locator.locate(std::string(18, 'N')).found);
}

CATCH_TEST_CASE("BarcodeLocator: allowed offsets", TEST_GROUP) {
    const auto read = FLANK + "TTGACAGT" + FLANK;

    config::LocatorConfig config;
    config.allowed_offsets = {0};
    CATCH_CHECK_FALSE(BarcodeLocator(test_index(), config).locate(read).found);

    config.allowed_offsets = {0, 5, 100};
    const auto decision = BarcodeLocator(test_index(), config).locate(read);
    CATCH_CHECK(decision.found);
    CATCH_CHECK(decision.offset == 5);

    config.allowed_offsets = {-1};
    CATCH_CHECK_THROWS_AS(BarcodeLocator(test_index(), config), ConfigurationError);
}

CATCH_TEST_CASE("BarcodeLocator: tie breaks", TEST_GROUP) {
    CATCH_SECTION("Closest to the expected offset, then smallest offset") {
        const auto read = "CC" + std::string("TTGACAGT") + "CC" + "TTGACAGT" + "CC";

        CATCH_CHECK(BarcodeLocator(test_index(), {}).locate(read).offset == 2);

        config::LocatorConfig config;
        config.expected_offset = 12;
        CATCH_CHECK(BarcodeLocator(test_index(), config).locate(read).offset == 12);
    }

    CATCH_SECTION("Exact match wins over a closer single substitution") {
        config::LocatorConfig config;
        config.expected_offset = 0;
        const auto decision =
                BarcodeLocator(test_index(), config).locate("TTGACAGA" + FLANK + "TTGACAGT");
        CATCH_CHECK(decision.offset == 13);
        CATCH_CHECK(decision.distance == 0);
    }

    CATCH_SECTION("Preferred orientation") {
        // AAACCCGG and its reverse complement CCGGGTTT are both whitelisted.
        const whitelist::WhitelistIndex index({"AAACCCGG", "CCGGGTTT"});
        const std::string read = "CCCAAACCCGGCCC";

        const auto forward = BarcodeLocator(index, {}).locate(read);
        CATCH_CHECK(forward.orientation == Orientation::forward);
        CATCH_CHECK(forward.barcode == "AAACCCGG");

        config::LocatorConfig config;
        config.prefer_forward = false;
        const auto reverse = BarcodeLocator(index, config).locate(read);
        CATCH_CHECK(reverse.orientation == Orientation::reverse_complement);
        CATCH_CHECK(reverse.offset == 3);
        CATCH_CHECK(reverse.barcode == "CCGGGTTT");
    }
}

CATCH_TEST_CASE("BarcodeLocator: quality length must match the sequence", TEST_GROUP) {
    const BarcodeLocator locator(test_index(), {});
    CATCH_CHECK_THROWS_AS(locator.locate(FLANK + "TTGACAGT", "IIII"), InputError);
}

CATCH_TEST_CASE("BarcodeLocator: raw window is kept alongside the normalised barcode", TEST_GROUP) {
    const BarcodeLocator locator(test_index(), {});

    CATCH_SECTION("Lower case forward window") {
        const auto decision = locator.locate(FLANK + "ttgacagt" + FLANK);
        CATCH_REQUIRE(decision.found);
        CATCH_CHECK(decision.distance == 0);
        CATCH_CHECK(decision.barcode == "TTGACAGT");
        CATCH_CHECK(decision.raw_barcode == "ttgacagt");
    }

    CATCH_SECTION("Ambiguity code in a reverse complemented window") {
        const auto decision = locator.locate(FLANK + "ACTGTYAA" + FLANK);
        CATCH_REQUIRE(decision.found);
        CATCH_CHECK(decision.orientation == Orientation::reverse_complement);
        CATCH_CHECK(decision.offset == 5);
        CATCH_CHECK(decision.distance == 1);
        CATCH_CHECK(decision.barcode == "TTNACAGT");
        CATCH_CHECK(decision.raw_barcode == "TTRACAGT");
    }
}

CATCH_TEST_CASE("BarcodeLocator: windows with a single called base are not hits", TEST_GROUP) {
    const BarcodeLocator locator(test_index(), {});

    CATCH_CHECK_FALSE(locator.locate("NNNNNNNA").found);
    CATCH_CHECK_FALSE(locator.locate("ANNNNNNN").found);

    // Two called bases still pin the window to the whitelist.
    const auto decision = locator.locate("NNNNNNGT");
    CATCH_REQUIRE(decision.found);
    CATCH_CHECK(decision.distance == 1);
    CATCH_CHECK(decision.orientation == Orientation::forward);
    CATCH_CHECK(decision.barcode == "NNNNNNGT");
}
