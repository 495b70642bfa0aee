#pragma once

#include <stdexcept>
#include <string>

namespace bcfix {

// Raised while setting up a run (malformed whitelist, invalid configuration values).
// Fatal: the run is aborted before any reads are processed.
class ConfigurationError : public std::runtime_error {
public:
    explicit ConfigurationError(const std::string& message) : std::runtime_error(message) {}
};

// Raised for a single malformed read (barcode or quality of the wrong length, quality values
// out of range). Callers processing a stream of reads treat it as a rejection of that read.
class InputError : public std::runtime_error {
public:
    explicit InputError(const std::string& message) : std::runtime_error(message) {}
};

}  // namespace bcfix
