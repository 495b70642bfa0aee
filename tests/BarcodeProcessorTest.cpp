#include "TestUtils.h"
#include "config/CorrectionConfig.h"
#include "hts_io/FastxSequentialReader.h"
#include "pipeline/BarcodeProcessor.h"
#include "priors/PriorTable.h"
#include "utils/errors.h"
#include "whitelist/WhitelistIndex.h"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>
#include <catch2/generators/catch_generators.hpp>

#include <cstdint>
#include <string>
#include <vector>

#define TEST_GROUP "[barcode_processor]"

using namespace bcfix;
using Catch::Approx;

namespace {

const std::string FLANK = "CCCCC";
const std::string FLANK_QUALITIES = "!!!!!";

const whitelist::WhitelistIndex& test_index() {
    static const whitelist::WhitelistIndex index({"AAACCCGG", "TTGACAGT", "GATTACAC"});
    return index;
}

// Forward exact, reverse complement exact, one substitution, no barcode.
std::vector<utils::ReadRecord> make_reads(int num_copies) {
    std::vector<utils::ReadRecord> reads;
    for (int i = 0; i < num_copies; ++i) {
        const std::string prefix = "read_" + std::to_string(i) + "_";
        reads.push_back({prefix + "fwd", "", FLANK + "TTGACAGT" + FLANK,
                         FLANK_QUALITIES + "ABCDEFGH" + FLANK_QUALITIES});
        reads.push_back({prefix + "rc", "", FLANK + "GTGTAATC" + FLANK,
                         FLANK_QUALITIES + "ABCDEFGH" + FLANK_QUALITIES});
        reads.push_back({prefix + "sub", "", FLANK + "TTGACAGA" + FLANK, std::string(18, 'I')});
        reads.push_back({prefix + "none", "", std::string(18, 'C'), std::string(18, 'I')});
    }
    return reads;
}

}  // namespace

CATCH_TEST_CASE("BarcodeProcessor: evaluate single reads", TEST_GROUP) {
    const auto priors = priors::PriorTable::uniform(test_index().size());
    const pipeline::BarcodeProcessor processor(test_index(), priors, config::CorrectionConfig{}, 1);
    const auto reads = make_reads(1);

    CATCH_SECTION("forward exact match") {
        const auto result = processor.evaluate(reads[0], nullptr);
        CATCH_CHECK_FALSE(result.invalid_input);
        CATCH_CHECK(result.orientation.orientation == locate::Orientation::forward);
        CATCH_CHECK(result.correction.status == correct::CorrectionStatus::exact);
        CATCH_CHECK(result.output.id == "read_0_fwd");
        CATCH_CHECK(result.output.sequence == "TTGACAGT");
        CATCH_CHECK(result.output.qstring == "ABCDEFGH");
        CATCH_CHECK(result.output.comment == "CR:Z:TTGACAGT\tCB:Z:TTGACAGT\tCY:Z:ABCDEFGH");
    }

    CATCH_SECTION("reverse complement exact match") {
        const auto result = processor.evaluate(reads[1], nullptr);
        CATCH_CHECK(result.orientation.orientation == locate::Orientation::reverse_complement);
        CATCH_CHECK(result.correction.status == correct::CorrectionStatus::exact);
        CATCH_CHECK(result.output.sequence == "GATTACAC");
        CATCH_CHECK(result.output.qstring == "HGFEDCBA");
    }

    CATCH_SECTION("single substitution is corrected") {
        const auto result = processor.evaluate(reads[2], nullptr);
        CATCH_CHECK(result.correction.status == correct::CorrectionStatus::corrected);
        CATCH_CHECK(result.correction.barcode == "TTGACAGT");
        CATCH_CHECK(result.correction.confidence == Approx(1.0));
        CATCH_CHECK(result.output.comment == "CR:Z:TTGACAGA\tCB:Z:TTGACAGT\tCY:Z:IIIIIIII");
    }

    CATCH_SECTION("raw tag keeps the read's own bases") {
        const utils::ReadRecord read{"lower", "", FLANK + "ttgacaga" + FLANK, std::string(18, 'I')};
        const auto result = processor.evaluate(read, nullptr);
        CATCH_CHECK(result.correction.status == correct::CorrectionStatus::corrected);
        CATCH_CHECK(result.output.sequence == "TTGACAGA");
        CATCH_CHECK(result.output.comment == "CR:Z:ttgacaga\tCB:Z:TTGACAGT\tCY:Z:IIIIIIII");
    }

    CATCH_SECTION("read without a barcode passes through") {
        const auto result = processor.evaluate(reads[3], nullptr);
        CATCH_CHECK_FALSE(result.orientation.found);
        CATCH_CHECK_FALSE(result.invalid_input);
        CATCH_CHECK(result.output == reads[3]);
    }

    CATCH_SECTION("located read without qualities is invalid") {
        const utils::ReadRecord read{"no_quals", "", FLANK + "TTGACAGT" + FLANK, ""};
        const auto result = processor.evaluate(read, nullptr);
        CATCH_CHECK(result.invalid_input);
        CATCH_CHECK(result.correction.reject_reason == correct::RejectReason::invalid_input);
    }

    CATCH_SECTION("mismatched qualities are invalid") {
        const utils::ReadRecord read{"short_quals", "", FLANK + "TTGACAGT" + FLANK, "III"};
        const auto result = processor.evaluate(read, nullptr);
        CATCH_CHECK(result.invalid_input);
    }
}

CATCH_TEST_CASE("BarcodeProcessor: batches keep read order and tally stats", TEST_GROUP) {
    auto num_threads = GENERATE(1, 4, 16);
    CATCH_CAPTURE(num_threads);
    const auto priors = priors::PriorTable::uniform(test_index().size());
    pipeline::BarcodeProcessor processor(test_index(), priors, config::CorrectionConfig{},
                                         num_threads);

    const auto reads = make_reads(25);
    // Second batch hits the per-thread caches.
    for (int batch = 0; batch < 2; ++batch) {
        const auto results = processor.process_batch(reads);
        CATCH_REQUIRE(results.size() == reads.size());
        for (size_t i = 0; i < reads.size(); ++i) {
            CATCH_CHECK(results[i].output.id == reads[i].id);
        }
        CATCH_CHECK(results[2].correction.status == correct::CorrectionStatus::corrected);
    }

    const auto& stats = processor.stats();
    CATCH_CHECK(stats.total == 200);
    CATCH_CHECK(stats.exact == 100);
    CATCH_CHECK(stats.corrected == 50);
    CATCH_CHECK(stats.ambiguous == 0);
    CATCH_CHECK(stats.rejected == 0);
    CATCH_CHECK(stats.not_found == 50);
    CATCH_CHECK(stats.invalid == 0);
    CATCH_CHECK(stats.forward == 100);
    CATCH_CHECK(stats.reverse_complement == 50);
    CATCH_CHECK(stats.matched_before_correction() == 100);
    CATCH_CHECK(stats.matched_after_correction() == 150);
}

CATCH_TEST_CASE("BarcodeProcessor: empty batch", TEST_GROUP) {
    const auto priors = priors::PriorTable::uniform(test_index().size());
    pipeline::BarcodeProcessor processor(test_index(), priors, config::CorrectionConfig{}, 2);

    CATCH_CHECK(processor.process_batch({}).empty());
    CATCH_CHECK(processor.stats().total == 0);
}

CATCH_TEST_CASE("BarcodeProcessor: invalid thread count", TEST_GROUP) {
    const auto priors = priors::PriorTable::uniform(test_index().size());
    CATCH_CHECK_THROWS_AS(
            pipeline::BarcodeProcessor(test_index(), priors, config::CorrectionConfig{}, 0),
            ConfigurationError);
}

CATCH_TEST_CASE("PriorCounter: counts exact matches only", TEST_GROUP) {
    auto num_threads = GENERATE(1, 3);
    CATCH_CAPTURE(num_threads);
    pipeline::PriorCounter counter(test_index(), config::LocatorConfig{}, num_threads);

    counter.count_batch(make_reads(10));
    counter.count_batch(make_reads(5));

    CATCH_CHECK(counter.num_reads() == 60);
    const auto accumulator = counter.merged_accumulator();
    CATCH_CHECK(accumulator.total() == 30);
    CATCH_CHECK(accumulator.count(0) == 0);
    CATCH_CHECK(accumulator.count(1) == 15);
    CATCH_CHECK(accumulator.count(2) == 15);
}

CATCH_TEST_CASE("PriorCounter: per-thread tallies persist across batches", TEST_GROUP) {
    auto num_threads = GENERATE(2, 8);
    CATCH_CAPTURE(num_threads);
    pipeline::PriorCounter counter(test_index(), config::LocatorConfig{}, num_threads);

    // Batches smaller than the thread count leave some partitions unused.
    for (int batch = 0; batch < 6; ++batch) {
        counter.count_batch(make_reads(1));
    }
    counter.count_batch({});

    CATCH_CHECK(counter.num_reads() == 24);

    // Merging reads the partial tallies without consuming them.
    const auto first = counter.merged_accumulator();
    const auto second = counter.merged_accumulator();
    CATCH_CHECK(first.counts() == std::vector<uint64_t>{0, 6, 6});
    CATCH_CHECK(second.counts() == first.counts());
    CATCH_CHECK(second.total() == 12);

    const auto priors = counter.finalize(1e-7);
    CATCH_CHECK_FALSE(priors.is_uniform());
    CATCH_CHECK(priors.prior(1) == Approx(priors.prior(2)));
    CATCH_CHECK(priors.prior(0) < 1e-6);
}

CATCH_TEST_CASE("PriorCounter: no exact matches gives uniform priors", TEST_GROUP) {
    pipeline::PriorCounter counter(test_index(), config::LocatorConfig{}, 2);
    counter.count_batch({{"none", "", std::string(18, 'C'), std::string(18, 'I')}});

    CATCH_CHECK(counter.merged_accumulator().total() == 0);
    CATCH_CHECK(counter.finalize(1e-7).is_uniform());
}

CATCH_TEST_CASE("BarcodeProcessor: two passes over a FASTQ file", TEST_GROUP) {
    const auto fastq = get_fastq_data_dir() / "reads.fastq";
    const config::CorrectionConfig config;

    auto read_file = [&fastq] {
        hts_io::FastxSequentialReader reader(fastq);
        std::vector<utils::ReadRecord> reads;
        utils::ReadRecord record;
        while (reader.get_next(record)) {
            reads.push_back(record);
        }
        return reads;
    };
    const auto reads = read_file();
    CATCH_REQUIRE(reads.size() == 4);

    pipeline::PriorCounter counter(test_index(), config.locator, 2);
    counter.count_batch(reads);
    CATCH_CHECK(counter.merged_accumulator().counts() == std::vector<uint64_t>{0, 1, 1});
    const auto priors = counter.finalize(config.prior_floor);

    pipeline::BarcodeProcessor processor(test_index(), priors, config, 2);
    const auto results = processor.process_batch(reads);
    CATCH_REQUIRE(results.size() == 4);
    CATCH_CHECK(results[0].output.id == "read_0");
    CATCH_CHECK(results[0].output.comment == "CR:Z:TTGACAGT\tCB:Z:TTGACAGT\tCY:Z:ABCDEFGH");
    CATCH_CHECK(results[1].output.comment == "CR:Z:GATTACAC\tCB:Z:GATTACAC\tCY:Z:HGFEDCBA");
    CATCH_CHECK(results[2].correction.status == correct::CorrectionStatus::corrected);
    CATCH_CHECK(results[2].output.comment == "CR:Z:TTGACAGA\tCB:Z:TTGACAGT\tCY:Z:IIIIIIII");
    CATCH_CHECK(results[3].output == reads[3]);
    CATCH_CHECK(processor.stats().matched_after_correction() == 3);
}
