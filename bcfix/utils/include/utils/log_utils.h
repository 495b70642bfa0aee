#pragma once
#include <spdlog/spdlog.h>

#include <utility>

namespace bcfix::utils {

// Initialises the default logger to point to stderr.
void InitLogging();

enum class VerboseLogLevel : int {
    none = 0,
    debug = 1,
    trace = 2,
};

void SetVerboseLogging(VerboseLogLevel level);

/// Note that enabling this has a measurable cost on large inputs.
#if BCFIX_ENABLE_PER_READ_TRACE
template <typename... Args>
void trace_log(spdlog::format_string_t<Args...> fmt_str, Args &&...args) {
    spdlog::trace(fmt_str, std::forward<Args>(args)...);
}

#else  // Per-read trace logging is disabled.
template <typename... Args>
void trace_log(fmt::format_string<Args...>, Args &&...) {}
#endif

}  // namespace bcfix::utils
