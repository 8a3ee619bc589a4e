#pragma once

#include <string>
#include <string_view>

namespace relpack {

/**
 * @brief Rewrite the version element of manifest text without disturbing anything else.
 *
 * The first occurrence of `<Version>{old_version}</Version>` is replaced with
 * `<Version>{new_version}</Version>`. All other bytes of the text are kept as-is, so comments,
 * indentation and line endings survive the rewrite.
 *
 * Throws `errc::patch_mismatch` if the literal pattern does not occur in the text.
 */
[[nodiscard]] std::string patch_manifest_version(std::string_view text,
                                                 std::string_view old_version,
                                                 std::string_view new_version);

}  // namespace relpack
