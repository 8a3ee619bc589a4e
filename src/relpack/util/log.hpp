#pragma once

#include <fmt/core.h>

#include <memory>
#include <string_view>

namespace spdlog::sinks {
class sink;
}

namespace relpack::log {

enum class level : int {
    trace,
    debug,
    info,
    warn,
    error,
    critical,
    silent,
};

/// Messages below this level are discarded before they are formatted
inline level current_log_level = level::info;

/**
 * @brief Install the "relpack" logger as the default logger, writing to stderr.
 *
 * Standard output is left to the command results (e.g. `ls` listings).
 */
void init_logger() noexcept;

/// Install the "relpack" logger as the default logger, writing to the given sink
void init_logger(std::shared_ptr<spdlog::sinks::sink> sink) noexcept;

/// Write an already-formatted message through the default logger
void log_print(level l, std::string_view s) noexcept;

template <typename T>
concept formattable = requires(const T item) {
    fmt::format("{}", item);
};

template <formattable... Args>
void log(level l, std::string_view s, const Args&... args) noexcept {
    log_print(l, fmt::vformat(s, fmt::make_format_args(args...)));
}

#define relpack_log(Level, str, ...)                                                               \
    do {                                                                                           \
        if (int(relpack::log::level::Level) >= int(relpack::log::current_log_level)) {             \
            ::relpack::log::log(::relpack::log::level::Level, str __VA_OPT__(, ) __VA_ARGS__);     \
        }                                                                                          \
    } while (0)

}  // namespace relpack::log
