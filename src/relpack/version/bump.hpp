#pragma once

#include <semver/version.hpp>

#include <cstddef>
#include <string>
#include <string_view>

namespace relpack {

/// The version string, as written in the manifest, that could not be understood
struct e_version_string {
    std::string value;
};

/// The offset within e_version_string at which version parsing stopped
struct e_version_offset {
    std::ptrdiff_t value;
};

/**
 * @brief Zero-pad a short version string to three numeric components.
 *
 * The `-prerelease` / `+build` suffix (everything from the first `-` or `+`) is split off,
 * trailing empty components of the numeric part are dropped, the remaining one or two components
 * are padded with `.0`, and the suffix is reattached unchanged. "1" becomes "1.0.0", "1.2-rc"
 * becomes "1.2.0-rc".
 *
 * If the numeric part has no components or more than three, the string is returned as-is.
 * No validation takes place.
 */
[[nodiscard]] std::string normalize_version(std::string_view s);

/**
 * @brief Parse a manifest version, accepting one to three numeric components.
 *
 * A strict parse is attempted first, then a strict parse of normalize_version(s).
 * Throws `errc::invalid_version` if neither succeeds.
 */
[[nodiscard]] semver::version parse_manifest_version(std::string_view s);

/**
 * @brief Increment the minor component of a version.
 *
 * The patch component is reset to zero only when the version has neither a prerelease tag nor
 * build metadata. When either is present the patch component is kept: "1.2.3-beta" becomes
 * "1.3.3-beta", but "1.2.3" becomes "1.3.0". Prerelease and build metadata are always kept.
 */
[[nodiscard]] semver::version bump_minor(semver::version v) noexcept;

/// Parse a manifest version and obtain the version that the next release will carry
[[nodiscard]] semver::version next_version(std::string_view s);

/**
 * @brief Compute the bumped, canonical version string for a manifest version string.
 *
 * Equivalent to `next_version(s).to_string()`.
 */
[[nodiscard]] std::string bump_version(std::string_view s);

}  // namespace relpack
