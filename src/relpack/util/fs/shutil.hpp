#pragma once

#include "./path.hpp"

#include <relpack/error/result.hpp>

namespace relpack {

struct e_remove_file {
    fs::path value;
};

struct e_move_file {
    fs::path source;
    fs::path dest;
};

/**
 * @brief Recursively remove whatever exists at the given path. A missing path is not an error.
 */
[[nodiscard]] result<void> ensure_absent(path_ref path) noexcept;

/**
 * @brief Move a file or directory to a new location.
 *
 * Uses an atomic rename where possible. If the source and destination are on different
 * filesystems, the source is first copied next to the destination and then renamed into place,
 * so a partial copy is never visible at `dest`.
 */
[[nodiscard]] result<void> move_file(path_ref source, path_ref dest);

}  // namespace relpack
