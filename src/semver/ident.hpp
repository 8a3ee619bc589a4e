#pragma once

#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace semver {

class invalid_ident : public std::runtime_error {
    std::string _str;

public:
    explicit invalid_ident(std::string s)
        : runtime_error("Invalid version identifier: '" + s + "'")
        , _str(std::move(s)) {}

    auto& string() const noexcept { return _str; }
};

/**
 * @brief The shape of a single dot-separated identifier in a prerelease or build tag.
 */
enum class ident_kind {
    // Contains at least one letter or hyphen
    alphanumeric,
    // Only digits, without a leading zero (or exactly "0")
    numeric,
    // Only digits, with a leading zero. Legal in build metadata only.
    digits,
};

class ident {
    std::string _str;
    ident_kind  _kind = ident_kind::alphanumeric;

public:
    /// Throws invalid_ident if the string is empty or has characters outside [0-9A-Za-z-]
    explicit ident(std::string_view str);

    auto        kind() const noexcept { return _kind; }
    const auto& string() const noexcept { return _str; }

    friend bool operator==(const ident& lhs, const ident& rhs) noexcept {
        return lhs._str == rhs._str;
    }
    friend bool operator!=(const ident& lhs, const ident& rhs) noexcept { return !(lhs == rhs); }

    /// Split a string on '.' and parse each part. Empty parts are an error.
    static std::vector<ident> parse_dotted_seq(std::string_view s);
};

/// Join identifiers back together with '.'
std::string join_idents(const std::vector<ident>& ids);

}  // namespace semver
