#pragma once

#include <relpack/util/fs/path.hpp>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

struct archive;

namespace relpack::zip {

/// The archive path of the ZIP entry being written or read
struct e_archive_entry {
    std::string value;
};

/// The ZIP file on disk being read
struct e_archive_file {
    fs::path value;
};

/// Unix permission bits recorded for regular files
inline constexpr std::uint32_t file_mode = 0100644;
/// Unix permission bits recorded for directories
inline constexpr std::uint32_t dir_mode = 040755;
/// The modification time of every written entry (2000-01-01 00:00:00 UTC)
inline constexpr std::int64_t fixed_mtime = 946684800;

/**
 * @brief A single member of a ZIP archive, as read back by read_archive()
 */
struct entry {
    /// The path of the entry. Always '/'-separated. Directories end with '/'
    std::string path;
    /// The uncompressed content. Empty for directories
    std::string content;
    /// Unix mode bits, including the file type bits
    std::uint32_t mode = file_mode;
    /// Modification time, in seconds since the Unix epoch
    std::int64_t mtime = 0;

    bool is_directory() const noexcept { return path.ends_with('/'); }
};

struct archive_write_deleter {
    void operator()(::archive*) const noexcept;
};

/**
 * @brief Assembles a deflated ZIP archive in memory.
 *
 * Every entry is written with the same timestamp (fixed_mtime), owner and Unix permissions, and
 * no comments, so the output depends only on the sequence of add_directory() and add_file()
 * calls and on the content given. Entries appear in the order they were added.
 */
class writer {
    // Heap-allocated so that libarchive's pointer to it survives moving the writer
    std::unique_ptr<std::string>                    _bytes;
    std::unique_ptr<::archive, archive_write_deleter> _archive;
    std::size_t                                      _n_entries = 0;

    void _add(std::string_view path, std::string_view content, bool is_dir);

public:
    /// Create a writer that deflates file content with the given compression level
    explicit writer(int level = 6);

    /// Add a directory entry. A trailing '/' is appended to `path` if it is missing.
    void add_directory(std::string_view path);
    /// Add a deflated regular-file entry
    void add_file(std::string_view path, std::string_view content);

    std::size_t entry_count() const noexcept { return _n_entries; }

    /// Write the central directory and obtain the complete archive bytes
    [[nodiscard]] std::string finish() &&;
};

/**
 * @brief Parse the entries of an in-memory ZIP archive.
 *
 * Entries are returned in archive order with their content fully decompressed. Throws
 * `errc::archive_failure` if the archive is malformed or any entry fails its CRC check.
 */
[[nodiscard]] std::vector<entry> read_archive_bytes(std::string_view bytes);

/// Read and parse the ZIP archive at the given path. See read_archive_bytes()
[[nodiscard]] std::vector<entry> read_archive(path_ref path);

}  // namespace relpack::zip
