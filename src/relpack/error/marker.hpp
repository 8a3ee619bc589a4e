#pragma once

#include <string_view>

namespace relpack {

/**
 * @brief Record a short machine-readable name for the error that is ending the process.
 *
 * If the `RELPACK_WRITE_ERROR_MARKER` environment variable names a file, the marker is written
 * there. Otherwise this only logs at trace level.
 */
void write_error_marker(std::string_view) noexcept;

}  // namespace relpack
