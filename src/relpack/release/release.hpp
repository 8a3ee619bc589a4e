#pragma once

#include "./archive.hpp"
#include "./collect.hpp"

#include <relpack/manifest/manifest.hpp>
#include <relpack/util/fs/path.hpp>

#include <string>
#include <string_view>

namespace relpack {

/**
 * @brief The steps of create_release(), in the order they run
 */
enum class release_stage {
    preflight,
    load_manifest,
    bump_version,
    patch_manifest,
    write_manifest,
    collect_files,
    build_archive,
    done,
};

/// The step of create_release() that was running when an error occurred
struct e_release_stage {
    release_stage value;
    /// Set once the bumped manifest has been written to disk. Never set for a dry run.
    bool manifest_written = false;

    bool manifest_was_written() const noexcept { return manifest_written; }
};

std::string_view release_stage_name(release_stage) noexcept;

struct release_params {
    /// The tool directory containing the manifest and scripts
    fs::path project_dir;
    /// Where the archive is written. If empty, `<project_dir>/release`
    fs::path       release_dir = {};
    archive_layout layout      = archive_layout::wrapped;

    std::string manifest_filename = "manifest.xml";
    std::string script_extension  = ".lua";
    std::string archive_extension = "xrnx";

    /// Compute and report the release without writing anything
    bool dry_run = false;
};

struct release_result {
    /// The manifest with its new version
    relpack::manifest manifest;
    std::string       old_version;
    std::string       new_version;
    /// The path of the created archive (or where it would have been created, for a dry run)
    fs::path         archive_path;
    release_file_set files;
};

/**
 * @brief Bump the version of a tool and package it into a release archive.
 *
 * The manifest is loaded, its version is bumped, the new version is written back to the
 * manifest, and the release files are packed into `<release_dir>/<Id>.<archive_extension>`,
 * replacing any existing file or directory at that path.
 *
 * Nothing is modified if the manifest is missing or invalid. If a failure occurs after the
 * manifest has been rewritten, the rewrite is not undone; the error carries an e_release_stage
 * that says so.
 */
release_result create_release(const release_params& params);

}  // namespace relpack
