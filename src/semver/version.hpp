#pragma once

#include <semver/build_metadata.hpp>
#include <semver/prerelease.hpp>

#include <cstddef>
#include <stdexcept>
#include <string>
#include <string_view>

namespace semver {

/**
 * @brief Thrown when a string is not a strict `major.minor.patch[-pre][+build]` version.
 *
 * `offset()` is the index in `string()` where parsing stopped.
 */
class invalid_version : public std::runtime_error {
    std::string    _string;
    std::ptrdiff_t _offset = 0;

public:
    invalid_version(std::string string, std::ptrdiff_t n)
        : runtime_error("Invalid semantic version: '" + string + "'")
        , _string(std::move(string))
        , _offset(n) {}

    auto& string() const noexcept { return _string; }
    auto  offset() const noexcept { return _offset; }
};

struct version {
    int major = 0;
    int minor = 0;
    int patch = 0;
    // Prerelease tag is optional:
    class prerelease prerelease = {};
    // Build metadata is optional:
    class build_metadata build_metadata = {};

    /**
     * @brief Parse a strict three-component version.
     *
     * Components may not have leading zeros and must be representable as `int`.
     */
    static version parse(std::string_view s);

    std::string to_string() const;
    bool        is_prerelease() const noexcept { return !prerelease.empty(); }
    bool        has_build_metadata() const noexcept { return !build_metadata.empty(); }

    friend inline std::string to_string(const version& ver) { return ver.to_string(); }
};

}  // namespace semver
