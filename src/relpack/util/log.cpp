#include "./log.hpp"

#include <neo/assert.hpp>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

using namespace relpack;

namespace {

spdlog::level::level_enum to_spdlog(log::level l, std::string_view msg) noexcept {
    switch (l) {
    case log::level::trace:
        return spdlog::level::trace;
    case log::level::debug:
        return spdlog::level::debug;
    case log::level::info:
        return spdlog::level::info;
    case log::level::warn:
        return spdlog::level::warn;
    case log::level::error:
        return spdlog::level::err;
    case log::level::critical:
        return spdlog::level::critical;
    case log::level::silent:
        return spdlog::level::off;
    }
    neo_assert_always(invariant, false, "Invalid log level", msg, int(l));
}

}  // namespace

void log::init_logger() noexcept {
    init_logger(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
}

void log::init_logger(std::shared_ptr<spdlog::sinks::sink> sink) noexcept {
    auto logger = std::make_shared<spdlog::logger>("relpack", std::move(sink));
    // Filtering happens against current_log_level before a message is formatted
    logger->set_level(spdlog::level::trace);
    logger->set_pattern("[%^%-5l%$] %v");
    spdlog::set_default_logger(std::move(logger));
}

void log::log_print(level l, std::string_view msg) noexcept {
    spdlog::default_logger_raw()->log(to_spdlog(l, msg), "{}", msg);
}
