#pragma once

#include <semver/ident.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace semver {

/**
 * @brief The dotted tag following a '-' in a version string, e.g. the "beta.2" in "1.0.0-beta.2"
 *
 * Numeric identifiers with leading zeros are rejected.
 */
class prerelease {
    std::vector<ident> _ids;

public:
    prerelease() = default;

    [[nodiscard]] bool empty() const noexcept { return _ids.empty(); }

    auto&       idents() const noexcept { return _ids; }
    std::string to_string() const { return join_idents(_ids); }

    static prerelease parse(std::string_view str);

    friend bool operator==(const prerelease& lhs, const prerelease& rhs) noexcept {
        return lhs._ids == rhs._ids;
    }
    friend bool operator!=(const prerelease& lhs, const prerelease& rhs) noexcept {
        return !(lhs == rhs);
    }
};

}  // namespace semver
