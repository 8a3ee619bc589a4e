#pragma once

#include <relpack/release/archive.hpp>
#include <relpack/util/log.hpp>

#include <filesystem>
#include <optional>

namespace debate {
class argument_parser;
}  // namespace debate

namespace relpack::cli {

namespace fs = std::filesystem;

/**
 * @brief Top-level relpack subcommands
 */
enum class subcommand {
    _none_,
    release,
    version,
    ls,
};

/**
 * @brief Complete aggregate of all relpack command-line options
 */
struct options {
    /// Fills in defaults from the environment (RELPACK_LOG_LEVEL, RELPACK_LAYOUT)
    options() noexcept;

    // The `--log-level` argument
    log::level log_level = log::level::info;

    // The `--project` argument, using the CWD as the default
    fs::path project_dir = fs::current_path();

    // The selected subcommand
    enum subcommand subcommand = subcommand::_none_;

    /**
     * @brief Parameters specific to 'relpack release'
     */
    struct {
        // `--layout`
        archive_layout layout = archive_layout::wrapped;
        // `--out`. If unset, the archive is placed in `<project>/release`
        std::optional<fs::path> out_dir;
        // `--dry-run`
        bool dry_run = false;
    } release;

    /**
     * @brief Parameters specific to 'relpack ls'
     */
    struct {
        fs::path archive;
    } ls;

    /// The absolute path to the project directory (resolved against the CWD)
    fs::path absolute_project_dir_path() const noexcept;

    /**
     * @brief Attach arguments and subcommands to the given argument parser, binding those
     * arguments to the values in this object.
     */
    void setup_parser(debate::argument_parser& parser) noexcept;
};

}  // namespace relpack::cli
