#include "bcfix_version.h"
#include "cli/cli.h"
#include "cli/cli_utils.h"
#include "config/CorrectionConfig.h"
#include "hts_io/FastxSequentialReader.h"
#include "pipeline/BarcodeProcessor.h"
#include "utils/errors.h"
#include "utils/log_utils.h"
#include "whitelist/WhitelistIndex.h"
#include "whitelist/whitelist_loader.h"

#include <argparse/argparse.hpp>
#include <spdlog/spdlog.h>

#include <cstdlib>
#include <sstream>
#include <string>
#include <vector>

namespace bcfix {

int count(int argc, char* argv[]) {
    argparse::ArgumentParser parser("bcfix count", BCFIX_VERSION,
                                    argparse::default_arguments::help);
    parser.add_description(
            "Count reads whose barcode matches the whitelist exactly. The counts can be passed "
            "to 'bcfix correct --counts' to skip its counting pass.");
    parser.add_argument("reads").help("FASTQ file of reads, optionally gzipped. '-' for stdin.");

    int verbosity = 0;
    cli::add_verbosity_argument(parser, verbosity);

    parser.add_argument("--whitelist")
            .help("File of whitelist barcodes, one per line, optionally gzipped.")
            .required();
    parser.add_argument("-o", "--output")
            .help("Output counts file (barcode<TAB>count). '-' for stdout.")
            .default_value(std::string("-"));
    parser.add_argument("--config")
            .help("TOML file overriding the default locator settings.")
            .default_value(std::string(""));
    cli::add_locator_arguments(parser);
    parser.add_argument("-n", "--max-reads")
            .help("Maximum number of reads to process. Process all reads by default.")
            .default_value(0)
            .scan<'i', int>();
    parser.add_argument("-t", "--threads")
            .help("Number of worker threads. Default uses all available threads.")
            .default_value(0)
            .scan<'i', int>();
    parser.add_argument("--batch-size")
            .help("Number of reads processed per batch.")
            .default_value(100000)
            .scan<'i', int>();

    try {
        cli::parse(parser, argc, argv);
    } catch (const std::exception& e) {
        std::ostringstream parser_stream;
        parser_stream << parser;
        spdlog::error("{}\n{}", e.what(), parser_stream.str());
        return EXIT_FAILURE;
    }

    utils::SetVerboseLogging(static_cast<utils::VerboseLogLevel>(verbosity));

    const int batch_size = parser.get<int>("--batch-size");
    const int max_reads = parser.get<int>("--max-reads");
    if (batch_size <= 0 || max_reads < 0) {
        spdlog::error("--batch-size must be > 0 and --max-reads >= 0.");
        return EXIT_FAILURE;
    }

    try {
        auto config = config::prepare_config(parser.get<std::string>("--config"));
        cli::apply_locator_arguments(parser, config.locator);
        config::validate(config);

        const whitelist::WhitelistIndex index(
                whitelist::load_whitelist(parser.get<std::string>("--whitelist")),
                config.max_n_expansions);
        spdlog::info("> Loaded {} whitelist barcodes of length {}", index.size(),
                     index.barcode_length());

        pipeline::PriorCounter counter(index, config.locator,
                                       cli::get_num_threads(parser.get<int>("--threads")));
        hts_io::FastxSequentialReader reader(parser.get<std::string>("reads"));
        std::vector<utils::ReadRecord> batch;
        while (cli::read_batch(reader, batch_size, max_reads, batch)) {
            counter.count_batch(batch);
        }
        const auto accumulator = counter.merged_accumulator();
        spdlog::info("> Counted {} exact matches in {} reads", accumulator.total(),
                     counter.num_reads());

        whitelist::write_barcode_counts(parser.get<std::string>("--output"), index,
                                        accumulator.counts());
    } catch (const ConfigurationError& e) {
        spdlog::error("Invalid setup: {}", e.what());
        return EXIT_FAILURE;
    } catch (const std::exception& e) {
        spdlog::error("{}", e.what());
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}

}  // namespace bcfix
