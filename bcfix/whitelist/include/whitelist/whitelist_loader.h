#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <utility>
#include <vector>

namespace bcfix::whitelist {

class WhitelistIndex;

using BarcodeCount = std::pair<std::string, uint64_t>;

// Reads one barcode per line from a plain or gzipped text file. Only the first token of each
// line is used (whitespace or comma separated); blank lines and lines starting with '#' are
// skipped. Throws ConfigurationError if the file cannot be read.
std::vector<std::string> load_whitelist(const std::filesystem::path& path);

// Reads "barcode<TAB>count" lines. Repeated barcodes are summed, in order of first appearance.
// Throws ConfigurationError on unreadable files or malformed lines.
std::vector<BarcodeCount> load_barcode_counts(const std::filesystem::path& path);

// Per-index counts for every barcode of the index found in the counts file. Barcodes missing from
// the whitelist are skipped and reported in the log.
std::vector<uint64_t> match_counts_to_whitelist(const std::vector<BarcodeCount>& counts,
                                                const WhitelistIndex& index);

// Writes "barcode<TAB>count" lines, skipping zero counts. "-" writes to stdout.
void write_barcode_counts(const std::filesystem::path& path,
                          const WhitelistIndex& index,
                          const std::vector<uint64_t>& counts);

}  // namespace bcfix::whitelist
