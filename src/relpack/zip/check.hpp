#pragma once

#include <string_view>

struct archive;

namespace relpack::zip {

/// Throw errc::archive_failure describing the most recent error of `a`
[[noreturn]] void throw_archive_error(::archive* a, std::string_view what);

/**
 * @brief Check the status code of a libarchive call.
 *
 * ARCHIVE_WARN is logged and ignored. Anything worse throws via throw_archive_error().
 */
void check_archive(::archive* a, int rc, std::string_view what);

}  // namespace relpack::zip
