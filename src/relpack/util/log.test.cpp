#include "./log.hpp"

#include <catch2/catch.hpp>
#include <spdlog/sinks/ostream_sink.h>
#include <spdlog/spdlog.h>

#include <sstream>

namespace {

/// Capture log output for the duration of a test, restoring the stderr logger afterwards
struct captured_log {
    std::ostringstream   out;
    relpack::log::level  prev_level = relpack::log::current_log_level;

    captured_log() {
        relpack::log::init_logger(std::make_shared<spdlog::sinks::ostream_sink_st>(out));
    }

    ~captured_log() {
        relpack::log::current_log_level = prev_level;
        relpack::log::init_logger();
    }
};

}  // namespace

TEST_CASE("Messages below the current level are dropped") {
    captured_log cap;
    relpack::log::current_log_level = relpack::log::level::info;
    relpack_log(debug, "Hidden {}", 1);
    relpack_log(info, "Released {} at {}", "MyTool", "0.10.0");
    relpack_log(error, "Failed");
    CHECK(cap.out.str() == "[info ] Released MyTool at 0.10.0\n[error] Failed\n");
}

TEST_CASE("The silent level drops everything") {
    captured_log cap;
    relpack::log::current_log_level = relpack::log::level::silent;
    relpack_log(critical, "Not shown");
    CHECK(cap.out.str().empty());
}

TEST_CASE("The trace level shows everything") {
    captured_log cap;
    relpack::log::current_log_level = relpack::log::level::trace;
    relpack_log(trace, "step {}", 1);
    relpack_log(debug, "step {}", 2);
    CHECK(cap.out.str() == "[trace] step 1\n[debug] step 2\n");
}
