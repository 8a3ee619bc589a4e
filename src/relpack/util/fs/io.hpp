#pragma once

#include <relpack/error/result.hpp>

#include <filesystem>
#include <iosfwd>
#include <string>
#include <string_view>

namespace relpack {

struct e_open_file_path {
    std::filesystem::path value;
};

struct e_write_file_path {
    std::filesystem::path value;
};

struct e_read_file_path {
    std::filesystem::path value;
};

/// The path whose existence could not be determined
struct e_stat_file_path {
    std::filesystem::path value;
};

/**
 * @brief Check whether a filesystem entity exists at the given path.
 *
 * Fails with a std::error_code if the check itself fails (e.g. permission denied on a parent).
 */
[[nodiscard]] result<bool> file_exists(std::filesystem::path const& filepath) noexcept;

[[nodiscard]] result<std::fstream> open_file(std::filesystem::path const& filepath,
                                             std::ios::openmode) noexcept;
[[nodiscard]] result<void>        write_file(std::filesystem::path const& path,
                                             std::string_view) noexcept;
[[nodiscard]] result<std::string> read_file(std::filesystem::path const& path) noexcept;

}  // namespace relpack
