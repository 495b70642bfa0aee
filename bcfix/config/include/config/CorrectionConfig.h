#pragma once

#include <cstddef>
#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

namespace bcfix::config {

struct LocatorConfig {
    // Hint for where the barcode starts in the read. Ties between candidate windows are broken
    // in favour of the window closest to this offset.
    std::optional<int> expected_offset;
    // Offsets (read coordinates) to search. Empty means every offset that fits the read.
    std::vector<int> allowed_offsets;
    // Orientation that wins when both orientations match equally well.
    bool prefer_forward = true;
};

struct CorrectionConfig {
    double confidence_threshold = 0.975;
    double ambiguity_margin = 0.01;
    double error_floor = 1e-4;
    double error_ceiling = 0.75;
    double any_base_likelihood = 0.25;
    double prior_floor = 1e-7;
    // Entries held by each per-thread correction cache, 0 disables caching.
    std::size_t cache_size = 100000;
    // Queries with Ns are expanded over all bases at the N positions up to this many
    // expansions, beyond that they are compared against every whitelist entry.
    std::size_t max_n_expansions = 4096;
    LocatorConfig locator;
};

// Throws ConfigurationError if any value is out of range.
void validate(const CorrectionConfig& config);

// Prepare the correction configuration. If a configuration file is given, parse it
// and override the defaults with the values it holds, otherwise return the defaults.
CorrectionConfig prepare_config(const std::string& config_file);

// Overloaded function that parses the configuration passed in as an input stream.
CorrectionConfig prepare_config(std::istream& is);

}  // namespace bcfix::config
