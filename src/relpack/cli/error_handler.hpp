#pragma once

#include <functional>

namespace relpack {

/**
 * @brief Run the given command, reporting any error that escapes it.
 *
 * @return The return value of `fn`, or the process exit code for the error that was handled.
 */
int handle_cli_errors(std::function<int()> fn) noexcept;

}  // namespace relpack
