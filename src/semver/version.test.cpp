#include "./version.hpp"

#include <catch2/catch.hpp>

TEST_CASE("Parsing") {
    auto v1 = semver::version::parse("1.2.3");
    CHECK(v1.major == 1);
    CHECK(v1.minor == 2);
    CHECK(v1.patch == 3);
    CHECK(v1.to_string() == "1.2.3");

    v1.minor = 10;
    CHECK(v1.to_string() == "1.10.3");

    v1 = semver::version::parse("0.0.0");
    CHECK(v1.to_string() == "0.0.0");

    v1 = semver::version::parse("1.2.3-rc1");
    CHECK(v1.prerelease == semver::prerelease::parse("rc1"));
    CHECK(v1.build_metadata.empty());
    CHECK(v1.to_string() == "1.2.3-rc1");

    v1 = semver::version::parse("1.2.3+build5");
    CHECK(v1.prerelease.empty());
    CHECK(v1.build_metadata.to_string() == "build5");
    CHECK(v1.to_string() == "1.2.3+build5");

    v1 = semver::version::parse("1.2.3-beta.2+exp.sha.5114f85");
    CHECK(v1.prerelease.to_string() == "beta.2");
    CHECK(v1.build_metadata.to_string() == "exp.sha.5114f85");
    CHECK(v1.to_string() == "1.2.3-beta.2+exp.sha.5114f85");

    // Leading zeros are fine in build metadata
    v1 = semver::version::parse("1.0.0+001");
    CHECK(v1.build_metadata.to_string() == "001");
}

TEST_CASE("Invalid versions") {
    struct invalid_version {
        std::string str;
        int         bad_offset;
    };
    invalid_version versions[] = {
        {"", 0},
        {"1", 1},
        {"1.", 2},
        {"1.2", 3},
        {"1.2.", 4},
        {"1.2.3.4", 5},
        {"a.b.c", 0},
        {"1e.3.1", 1},
        {"01.2.3", 0},
        {"1.02.3", 2},
        {"1.2.5-", 6},
        {"1.2.5-02", 6},
        {"1.2.3-1..3", 6},
        {"1.2.3+", 6},
        {"1.2.3-beta+", 11},
        {"99999999999.0.0", 0},
    };
    for (auto&& [str, bad_offset] : versions) {
        INFO("Checking for failure while parsing bad version string '" << str << "'");
        try {
            auto ver = semver::version::parse(str);
            FAIL_CHECK("Parsing didn't throw! Produced version: " << ver.to_string());
        } catch (const semver::invalid_version& e) {
            CHECK(e.string() == str);
            CHECK(e.offset() == bad_offset);
        }
    }
}
