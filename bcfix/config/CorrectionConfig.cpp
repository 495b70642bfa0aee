#include "config/CorrectionConfig.h"

#include "utils/errors.h"

#include <spdlog/spdlog.h>
#include <toml.hpp>

#include <filesystem>
#include <fstream>
#include <istream>
#include <sstream>
#include <string>

namespace bcfix::config {
namespace {

void check_probability(double value, const std::string& key) {
    if (!(value > 0.0 && value <= 1.0)) {
        throw ConfigurationError(key + " must be in the range (0, 1], given " +
                                 std::to_string(value));
    }
}

CorrectionConfig update_config(const toml::value& config_toml, CorrectionConfig config) {
    if (config_toml.contains("correction")) {
        const auto& correction = toml::find(config_toml, "correction");

        if (correction.contains("confidence_threshold")) {
            config.confidence_threshold = toml::find<double>(correction, "confidence_threshold");
        }
        if (correction.contains("ambiguity_margin")) {
            config.ambiguity_margin = toml::find<double>(correction, "ambiguity_margin");
        }
        if (correction.contains("error_floor")) {
            config.error_floor = toml::find<double>(correction, "error_floor");
        }
        if (correction.contains("error_ceiling")) {
            config.error_ceiling = toml::find<double>(correction, "error_ceiling");
        }
        if (correction.contains("any_base_likelihood")) {
            config.any_base_likelihood = toml::find<double>(correction, "any_base_likelihood");
        }
        if (correction.contains("cache_size")) {
            const auto cache_size = toml::find<int64_t>(correction, "cache_size");
            if (cache_size < 0) {
                throw ConfigurationError("cache_size needs to be >= 0, given " +
                                         std::to_string(cache_size));
            }
            config.cache_size = static_cast<std::size_t>(cache_size);
        }
        if (correction.contains("max_n_expansions")) {
            const auto max_n_expansions = toml::find<int64_t>(correction, "max_n_expansions");
            if (max_n_expansions <= 0) {
                throw ConfigurationError("max_n_expansions needs to be > 0, given " +
                                         std::to_string(max_n_expansions));
            }
            config.max_n_expansions = static_cast<std::size_t>(max_n_expansions);
        }
    }

    if (config_toml.contains("priors")) {
        const auto& priors = toml::find(config_toml, "priors");
        if (priors.contains("prior_floor")) {
            config.prior_floor = toml::find<double>(priors, "prior_floor");
        }
    }

    if (config_toml.contains("locator")) {
        const auto& locator = toml::find(config_toml, "locator");
        if (locator.contains("expected_offset")) {
            config.locator.expected_offset = toml::find<int>(locator, "expected_offset");
        }
        if (locator.contains("allowed_offsets")) {
            config.locator.allowed_offsets = toml::find<std::vector<int>>(locator, "allowed_offsets");
        }
        if (locator.contains("prefer_forward")) {
            config.locator.prefer_forward = toml::find<bool>(locator, "prefer_forward");
        }
    }

    return config;
}

}  // namespace

void validate(const CorrectionConfig& config) {
    check_probability(config.confidence_threshold, "confidence_threshold");
    check_probability(config.any_base_likelihood, "any_base_likelihood");
    check_probability(config.prior_floor, "prior_floor");
    check_probability(config.error_floor, "error_floor");
    check_probability(config.error_ceiling, "error_ceiling");
    if (config.ambiguity_margin < 0.0 || config.ambiguity_margin >= 1.0) {
        throw ConfigurationError("ambiguity_margin must be in the range [0, 1), given " +
                                 std::to_string(config.ambiguity_margin));
    }
    if (config.error_ceiling >= 1.0) {
        throw ConfigurationError("error_ceiling must be < 1, given " +
                                 std::to_string(config.error_ceiling));
    }
    if (config.error_floor >= config.error_ceiling) {
        throw ConfigurationError("error_floor must be < error_ceiling.");
    }
    if (config.max_n_expansions == 0) {
        throw ConfigurationError("max_n_expansions needs to be > 0.");
    }
    if (config.locator.expected_offset && *config.locator.expected_offset < 0) {
        throw ConfigurationError("expected_offset needs to be >= 0, given " +
                                 std::to_string(*config.locator.expected_offset));
    }
    for (const int offset : config.locator.allowed_offsets) {
        if (offset < 0) {
            throw ConfigurationError("allowed_offsets must not contain negative offsets, given " +
                                     std::to_string(offset));
        }
    }
}

CorrectionConfig prepare_config(std::istream& is) {
    CorrectionConfig config;
    try {
        const toml::value config_toml = toml::parse(is);
        config = update_config(config_toml, CorrectionConfig{});
    } catch (const toml::exception& e) {
        throw ConfigurationError(std::string("Invalid correction configuration: ") + e.what());
    }
    validate(config);
    return config;
}

CorrectionConfig prepare_config(const std::string& config_file) {
    if (config_file.empty()) {
        std::stringstream buffer("");
        return prepare_config(buffer);
    }

    if (!std::filesystem::exists(config_file) || !std::filesystem::is_regular_file(config_file)) {
        throw ConfigurationError("Correction config file doesn't exist at " + config_file);
    }
    std::ifstream file(config_file);
    if (!file.is_open()) {
        throw ConfigurationError("Failed to open file " + config_file);
    }
    spdlog::debug("Loading correction configuration from {}", config_file);

    std::stringstream buffer;
    buffer << file.rdbuf();
    return prepare_config(buffer);
}

}  // namespace bcfix::config
