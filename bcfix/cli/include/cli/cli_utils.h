// Add some utilities for CLI.
#pragma once

#include "config/CorrectionConfig.h"
#include "hts_io/FastxSequentialReader.h"
#include "utils/ReadRecord.h"

#include <argparse/argparse.hpp>

#include <algorithm>
#include <cstddef>
#include <optional>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace bcfix::cli {

inline void parse(argparse::ArgumentParser& parser, const std::vector<std::string>& arguments) {
    parser.parse_args(arguments);
}

inline void parse(argparse::ArgumentParser& parser, int argc, const char* const argv[]) {
    return parse(parser, {argv, argv + argc});
}

template <typename T>
std::optional<T> get_optional_argument(const std::string& arg_name,
                                       const argparse::ArgumentParser& parser) {
    return parser.is_used(arg_name) ? std::optional<T>(parser.get<T>(arg_name)) : std::nullopt;
}

// 0 means use all available threads.
inline int get_num_threads(int requested) {
    if (requested > 0) {
        return requested;
    }
    return std::max(1, static_cast<int>(std::thread::hardware_concurrency()));
}

inline void add_verbosity_argument(argparse::ArgumentParser& parser, int& verbosity) {
    parser.add_argument("-v", "--verbose")
            .help("Increase logging verbosity, can be repeated.")
            .flag()
            .nargs(0)
            .action([&](const auto&) { ++verbosity; })
            .append();
}

// Arguments shared by every subcommand that locates barcodes in reads.
inline void add_locator_arguments(argparse::ArgumentParser& parser) {
    parser.add_argument("--expected-offset")
            .help("Expected start of the barcode in the read. Ties between matching windows are "
                  "broken in favour of the closest one.")
            .scan<'i', int>();
    parser.add_argument("--allowed-offsets")
            .help("Offsets at which to search for the barcode. Default is every offset.")
            .nargs(argparse::nargs_pattern::at_least_one)
            .scan<'i', int>();
    parser.add_argument("--prefer-reverse")
            .help("When both orientations match equally well, prefer the reverse complement.")
            .flag();
}

inline void apply_locator_arguments(const argparse::ArgumentParser& parser,
                                    config::LocatorConfig& config) {
    if (auto expected_offset = get_optional_argument<int>("--expected-offset", parser)) {
        config.expected_offset = *expected_offset;
    }
    if (parser.is_used("--allowed-offsets")) {
        config.allowed_offsets = parser.get<std::vector<int>>("--allowed-offsets");
    }
    if (parser.get<bool>("--prefer-reverse")) {
        config.prefer_forward = false;
    }
}

// Reads up to batch_size records, fewer if max_reads (0 for unlimited) would be exceeded.
// Returns false once no records are left to process.
inline bool read_batch(hts_io::FastxSequentialReader& reader,
                       std::size_t batch_size,
                       std::size_t max_reads,
                       std::vector<utils::ReadRecord>& batch) {
    batch.clear();
    utils::ReadRecord record;
    while (batch.size() < batch_size) {
        if (max_reads > 0 && reader.num_records() >= max_reads) {
            break;
        }
        if (!reader.get_next(record)) {
            break;
        }
        batch.push_back(std::move(record));
    }
    return !batch.empty();
}

}  // namespace bcfix::cli
