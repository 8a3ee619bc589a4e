#pragma once

#include "./collect.hpp"

#include <relpack/util/fs/path.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace relpack {

/**
 * @brief How the files of a release are placed within the archive
 */
enum class archive_layout {
    /// Every file sits at the root of the archive
    flat,
    /// Every file sits within a single top-level directory named after the archive
    wrapped,
};

/// Parse the name of an archive_layout ("flat" or "wrapped")
[[nodiscard]] std::optional<archive_layout> parse_archive_layout(std::string_view) noexcept;

struct archive_params {
    /// The archive file to create. Anything already at this path is replaced.
    fs::path       dest;
    archive_layout layout = archive_layout::wrapped;
    /// The wrapping directory for archive_layout::wrapped. Defaults to the filename of `dest`.
    std::string wrap_dir = {};
};

/**
 * @brief Generate the bytes of a release archive in memory.
 *
 * Each file's content is read from disk. The bytes depend only on the file set, the layout,
 * `wrap_dir` and the content of the files.
 */
[[nodiscard]] std::string
build_release_archive(const release_file_set& files, archive_layout, std::string_view wrap_dir);

/**
 * @brief Create a release archive on disk.
 *
 * The archive is generated in a temporary directory beside `params.dest` and renamed into place,
 * so `params.dest` never holds a partially written archive. The parent directory of the
 * destination is created if it does not exist.
 */
void create_release_archive(const release_file_set& files, const archive_params& params);

}  // namespace relpack
