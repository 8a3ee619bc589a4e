#include "./prerelease.hpp"

#include <catch2/catch.hpp>

TEST_CASE("Parse a prerelease") {
    auto pre = semver::prerelease::parse("rc.1");
    CHECK(pre.idents() == semver::ident::parse_dotted_seq("rc.1"));
    CHECK(pre.to_string() == "rc.1");
    CHECK_FALSE(pre.empty());
    CHECK(semver::prerelease{}.empty());
}

TEST_CASE("Invalid prereleases") {
    std::string_view bad_tags[] = {
        "rc.",     // Trailing dot
        "rc.01",   // Leading zero
        "beta_2",  // Underscore
    };
    for (auto bad : bad_tags) {
        INFO("Parsing bad prerelease tag '" << bad << "'");
        CHECK_THROWS_AS(semver::prerelease::parse(bad), semver::invalid_ident);
    }
}
