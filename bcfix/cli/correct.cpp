#include "bcfix_version.h"
#include "cli/cli.h"
#include "cli/cli_utils.h"
#include "config/CorrectionConfig.h"
#include "hts_io/FastqWriter.h"
#include "hts_io/FastxSequentialReader.h"
#include "pipeline/BarcodeProcessor.h"
#include "priors/PriorTable.h"
#include "utils/errors.h"
#include "utils/log_utils.h"
#include "whitelist/WhitelistIndex.h"
#include "whitelist/whitelist_loader.h"

#include <argparse/argparse.hpp>
#include <spdlog/spdlog.h>

#include <cstdint>
#include <cstdlib>
#include <sstream>
#include <string>
#include <vector>

namespace bcfix {

namespace {

config::CorrectionConfig build_config(const argparse::ArgumentParser& parser) {
    auto config = config::prepare_config(parser.get<std::string>("--config"));
    cli::apply_locator_arguments(parser, config.locator);
    if (auto threshold = cli::get_optional_argument<double>("--confidence-threshold", parser)) {
        config.confidence_threshold = *threshold;
    }
    if (auto margin = cli::get_optional_argument<double>("--ambiguity-margin", parser)) {
        config.ambiguity_margin = *margin;
    }
    if (auto cache_size = cli::get_optional_argument<int>("--cache-size", parser)) {
        if (*cache_size < 0) {
            throw ConfigurationError("--cache-size needs to be >= 0.");
        }
        config.cache_size = static_cast<std::size_t>(*cache_size);
    }
    config::validate(config);
    return config;
}

priors::PriorTable count_priors(const std::string& reads,
                                const whitelist::WhitelistIndex& index,
                                const config::CorrectionConfig& config,
                                int threads,
                                std::size_t batch_size,
                                std::size_t max_reads) {
    spdlog::info("> Counting exact whitelist matches");
    pipeline::PriorCounter counter(index, config.locator, threads);
    hts_io::FastxSequentialReader reader(reads);
    std::vector<utils::ReadRecord> batch;
    while (cli::read_batch(reader, batch_size, max_reads, batch)) {
        counter.count_batch(batch);
    }
    const auto accumulator = counter.merged_accumulator();
    spdlog::info("> Counted {} exact matches in {} reads", accumulator.total(),
                 counter.num_reads());
    return accumulator.finalize(config.prior_floor);
}

priors::PriorTable load_priors(const std::string& counts_file,
                               const whitelist::WhitelistIndex& index,
                               const config::CorrectionConfig& config) {
    const auto counts = whitelist::match_counts_to_whitelist(
            whitelist::load_barcode_counts(counts_file), index);
    priors::PriorAccumulator accumulator(index);
    for (uint32_t i = 0; i < counts.size(); ++i) {
        if (counts[i] > 0) {
            accumulator.accumulate(i, counts[i]);
        }
    }
    spdlog::info("> Loaded {} barcode counts from {}", accumulator.total(), counts_file);
    return accumulator.finalize(config.prior_floor);
}

}  // namespace

int correct(int argc, char* argv[]) {
    argparse::ArgumentParser parser("bcfix correct", BCFIX_VERSION,
                                    argparse::default_arguments::help);
    parser.add_description(
            "Locate barcodes in reads and correct them against a whitelist. Writes one FASTQ "
            "record per input read holding the extracted barcode, tagged with CR:Z (raw barcode), "
            "CY:Z (raw qualities) and, when assigned, CB:Z (whitelist barcode).");
    parser.add_argument("reads").help("FASTQ file of reads, optionally gzipped. '-' for stdin.");

    int verbosity = 0;
    cli::add_verbosity_argument(parser, verbosity);

    {
        parser.add_group("Input data arguments");
        parser.add_argument("--whitelist")
                .help("File of whitelist barcodes, one per line, optionally gzipped.")
                .required();
        parser.add_argument("--counts")
                .help("Barcode counts (barcode<TAB>count) to build priors from, as written by "
                      "'bcfix count'. Skips the counting pass.");
        parser.add_argument("--single-pass")
                .help("Skip the counting pass and use uniform priors.")
                .flag();
        parser.add_argument("-n", "--max-reads")
                .help("Maximum number of reads to process. Process all reads by default.")
                .default_value(0)
                .scan<'i', int>();
    }
    {
        parser.add_group("Output arguments");
        parser.add_argument("-o", "--output")
                .help("Output FASTQ, compressed if the name ends in .gz. '-' for stdout.")
                .default_value(std::string("-"));
    }
    {
        parser.add_group("Correction arguments");
        parser.add_argument("--config")
                .help("TOML file overriding the default correction settings.")
                .default_value(std::string(""));
        parser.add_argument("--confidence-threshold")
                .help("Minimum posterior probability to accept a correction.")
                .scan<'g', double>();
        parser.add_argument("--ambiguity-margin")
                .help("Minimum relative gap between the two best candidates.")
                .scan<'g', double>();
        cli::add_locator_arguments(parser);
    }
    {
        parser.add_group("Advanced arguments");
        parser.add_argument("-t", "--threads")
                .help("Number of worker threads. Default uses all available threads.")
                .default_value(0)
                .scan<'i', int>();
        parser.add_argument("--batch-size")
                .help("Number of reads processed per batch.")
                .default_value(100000)
                .scan<'i', int>();
        parser.add_argument("--cache-size")
                .help("Entries in each worker's correction cache, 0 to disable.")
                .scan<'i', int>();
    }

    try {
        cli::parse(parser, argc, argv);
    } catch (const std::exception& e) {
        std::ostringstream parser_stream;
        parser_stream << parser;
        spdlog::error("{}\n{}", e.what(), parser_stream.str());
        return EXIT_FAILURE;
    }

    utils::SetVerboseLogging(static_cast<utils::VerboseLogLevel>(verbosity));

    const auto reads = parser.get<std::string>("reads");
    const auto output = parser.get<std::string>("--output");
    const auto counts_file = cli::get_optional_argument<std::string>("--counts", parser);
    const bool single_pass = parser.get<bool>("--single-pass");
    const int threads = cli::get_num_threads(parser.get<int>("--threads"));
    const int batch_size = parser.get<int>("--batch-size");
    const int max_reads = parser.get<int>("--max-reads");

    if (counts_file && single_pass) {
        spdlog::error("--counts and --single-pass cannot be used together.");
        return EXIT_FAILURE;
    }
    if (!counts_file && !single_pass && reads == "-") {
        spdlog::error("Counting priors needs two passes over the reads, which is not possible when "
                      "reading from stdin. Use --counts or --single-pass.");
        return EXIT_FAILURE;
    }
    if (batch_size <= 0 || max_reads < 0) {
        spdlog::error("--batch-size must be > 0 and --max-reads >= 0.");
        return EXIT_FAILURE;
    }

    try {
        const auto config = build_config(parser);

        spdlog::info("> Loading whitelist");
        const whitelist::WhitelistIndex index(
                whitelist::load_whitelist(parser.get<std::string>("--whitelist")),
                config.max_n_expansions);
        spdlog::info("> Loaded {} whitelist barcodes of length {}", index.size(),
                     index.barcode_length());

        const auto priors = counts_file ? load_priors(*counts_file, index, config)
                            : single_pass
                                    ? priors::PriorTable::uniform(index.size())
                                    : count_priors(reads, index, config, threads, batch_size,
                                                   max_reads);

        spdlog::info("> Correcting barcodes");
        pipeline::BarcodeProcessor processor(index, priors, config, threads);
        hts_io::FastxSequentialReader reader(reads);
        hts_io::FastqWriter writer(output, threads);
        std::vector<utils::ReadRecord> batch;
        while (cli::read_batch(reader, batch_size, max_reads, batch)) {
            for (const auto& result : processor.process_batch(batch)) {
                writer.write(result.output);
            }
        }
        writer.finalise();
        processor.log_summary();
    } catch (const ConfigurationError& e) {
        spdlog::error("Invalid setup: {}", e.what());
        return EXIT_FAILURE;
    } catch (const std::exception& e) {
        spdlog::error("{}", e.what());
        return EXIT_FAILURE;
    }

    spdlog::info("> Finished");
    return EXIT_SUCCESS;
}

}  // namespace bcfix
