#include "utils/log_utils.h"

#include "utils/tty_utils.h"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <unistd.h>

#include <array>
#include <cstdio>
#include <string>

namespace bcfix::utils {

namespace {

// Path behind a file descriptor, or an empty string if it cannot be resolved.
std::string get_file_path(int fd) {
    std::array<char, 256> file_path;
    std::array<char, 256> procfd_path;
    std::snprintf(procfd_path.data(), procfd_path.size(), "/proc/self/fd/%d", fd);
    ssize_t len = readlink(procfd_path.data(), file_path.data(), file_path.size() - 1);
    if (len != -1) {
        file_path[len] = '\0';
        return std::string(file_path.data());
    }
    return "";
}

// Logging to stderr is unsafe when stderr is redirected into the same file as stdout, which
// carries FASTQ output when writing to '-'.
bool is_safe_to_log() {
    if (get_file_path(fileno(stdout)) == get_file_path(fileno(stderr))) {
        return is_fd_tty(stderr);
    }
    return true;
}

}  // namespace

void InitLogging() {
    // Replace the default (stdout) logger with a colour stderr logger, going through an
    // arbitrarily-named logger first to prevent a name clash.
    spdlog::set_default_logger(spdlog::stderr_color_mt("unused_name"));
    spdlog::set_default_logger(spdlog::stderr_color_mt(""));
    if (!is_safe_to_log()) {
        spdlog::set_level(spdlog::level::off);
    }
}

void SetVerboseLogging(VerboseLogLevel level) {
    if (!is_safe_to_log()) {
        return;
    }
    if (level >= VerboseLogLevel::trace) {
        spdlog::set_level(spdlog::level::trace);
    } else if (level == VerboseLogLevel::debug) {
        spdlog::set_level(spdlog::level::debug);
    }
}

}  // namespace bcfix::utils
