#include "./error_handler.hpp"

#include <relpack/error/errors.hpp>
#include <relpack/error/marker.hpp>
#include <relpack/manifest/error.hpp>
#include <relpack/release/collect.hpp>
#include <relpack/release/release.hpp>
#include <relpack/util/fs/io.hpp>
#include <relpack/util/fs/shutil.hpp>
#include <relpack/util/fs/staging.hpp>
#include <relpack/util/log.hpp>
#include <relpack/version/bump.hpp>
#include <relpack/zip/zip.hpp>

#include <boost/leaf.hpp>
#include <sstream>
#include <system_error>

using namespace relpack;

namespace {

/// Explain what has already happened to the manifest if a release failed part-way
void note_release_stage(const e_release_stage* stage, const e_manifest_path* man_path) {
    if (!stage) {
        return;
    }
    relpack_log(debug, "Release failed during stage '{}'", release_stage_name(stage->value));
    if (stage->manifest_was_written()) {
        relpack_log(warn,
                    "The manifest [{}] was already updated to the new version. Releasing again "
                    "will bump the version once more.",
                    man_path ? man_path->value.string() : std::string("manifest.xml"));
    }
}

void note_manifest_path(const e_manifest_path* man_path) {
    if (man_path) {
        relpack_log(error, "  (While reading the manifest [{}])", man_path->value.string());
    }
}

std::string diag_string(const boost::leaf::verbose_diagnostic_info& diag) {
    std::stringstream strm;
    strm << diag;
    return strm.str();
}

void log_explanation(const error_base& exc) {
    relpack_log(error, "{}", exc.explanation());
    relpack_log(error, "Refer: {}", exc.error_reference());
}

auto handlers = std::tuple(  //
    [](user_error<errc::malformed_manifest> const& exc,
       e_manifest_parse_error                      parse_err,
       e_manifest_path const*                      man_path) {
        relpack_log(error, "Invalid manifest: {}", parse_err.message);
        if (parse_err.line > 0) {
            relpack_log(error, "  (At line {})", parse_err.line);
        }
        note_manifest_path(man_path);
        log_explanation(exc);
        write_error_marker(error_marker_of(exc.get_errc()));
        return 1;
    },
    [](user_error<errc::missing_manifest_field> const& exc,
       e_missing_manifest_field                      field,
       e_manifest_path const*                        man_path) {
        relpack_log(error, "The manifest is missing a required <{}> element", field.value);
        note_manifest_path(man_path);
        log_explanation(exc);
        write_error_marker(error_marker_of(exc.get_errc()));
        return 1;
    },
    [](user_error<errc::invalid_version> const& exc,
       e_version_string                       given,
       e_version_offset const*                offset,
       e_manifest_path const*                 man_path) {
        relpack_log(error, "Invalid version string '{}'", given.value);
        if (offset && offset->value >= 0
            && std::size_t(offset->value) <= given.value.size()) {
            relpack_log(error, "  {}", given.value);
            relpack_log(error, "  {}^", std::string(std::size_t(offset->value), ' '));
        }
        note_manifest_path(man_path);
        log_explanation(exc);
        write_error_marker(error_marker_of(exc.get_errc()));
        return 1;
    },
    [](user_error<errc::patch_mismatch> const& exc,
       e_patch_pattern                       pattern,
       e_manifest_path const*                man_path) {
        relpack_log(error,
                    "Cannot rewrite the manifest version: The text '{}' does not appear in it",
                    pattern.value);
        note_manifest_path(man_path);
        log_explanation(exc);
        write_error_marker(error_marker_of(exc.get_errc()));
        return 1;
    },
    [](user_error<errc::archive_failure> const& exc,
       zip::e_archive_entry const*            entry,
       zip::e_archive_file const*             file,
       e_release_stage const*                 stage,
       e_manifest_path const*                 man_path) {
        relpack_log(error, "{}", exc.what());
        if (entry) {
            relpack_log(error, "  (While processing archive entry [{}])", entry->value);
        }
        if (file) {
            relpack_log(error, "  (While reading archive [{}])", file->value.string());
        }
        log_explanation(exc);
        note_release_stage(stage, man_path);
        write_error_marker(error_marker_of(exc.get_errc()));
        return 1;
    },
    [](std::error_code                   ec,
       e_read_file_path                  path,
       zip::e_archive_entry const*       entry,
       e_release_stage const*            stage,
       e_manifest_path const*            man_path) {
        relpack_log(error, "Failed to read file [{}]: {}", path.value.string(), ec.message());
        if (entry) {
            relpack_log(error, "  (While adding archive entry [{}])", entry->value);
        }
        note_release_stage(stage, man_path);
        write_error_marker("io-error");
        return 1;
    },
    [](std::error_code        ec,
       e_stat_file_path       path,
       e_release_stage const* stage,
       e_manifest_path const* man_path) {
        relpack_log(error, "Failed to check for [{}]: {}", path.value.string(), ec.message());
        note_release_stage(stage, man_path);
        write_error_marker("io-error");
        return 1;
    },
    [](std::error_code ec,
       e_write_file_path path,
       e_release_stage const* stage,
       e_manifest_path const* man_path) {
        relpack_log(error, "Failed to write file [{}]: {}", path.value.string(), ec.message());
        note_release_stage(stage, man_path);
        write_error_marker("io-error");
        return 1;
    },
    [](std::error_code ec,
       e_move_file move,
       e_release_stage const* stage,
       e_manifest_path const* man_path) {
        relpack_log(error,
                    "Failed to move [{}] into place at [{}]: {}",
                    move.source.string(),
                    move.dest.string(),
                    ec.message());
        note_release_stage(stage, man_path);
        write_error_marker("io-error");
        return 1;
    },
    [](std::error_code ec,
       e_remove_file path,
       e_release_stage const* stage,
       e_manifest_path const* man_path) {
        relpack_log(error,
                    "Failed to remove existing [{}]: {}",
                    path.value.string(),
                    ec.message());
        note_release_stage(stage, man_path);
        write_error_marker("io-error");
        return 1;
    },
    [](std::system_error const& exc,
       e_staging_parent       parent,
       e_release_stage const* stage,
       e_manifest_path const* man_path) {
        relpack_log(error,
                    "Failed to create a staging directory in [{}]: {}",
                    parent.value.string(),
                    exc.code().message());
        note_release_stage(stage, man_path);
        write_error_marker("io-error");
        return 1;
    },
    [](std::system_error const& exc,
       e_collect_dir          dir,
       e_release_stage const* stage,
       e_manifest_path const* man_path) {
        relpack_log(error,
                    "Failed to list the release files in [{}]: {}",
                    dir.value.string(),
                    exc.code().message());
        note_release_stage(stage, man_path);
        write_error_marker("io-error");
        return 1;
    },
    [](error_base const&                           exc,
       boost::leaf::verbose_diagnostic_info const& diag,
       e_release_stage const*                      stage,
       e_manifest_path const*                      man_path) {
        relpack_log(error, "{}", exc.what());
        note_manifest_path(man_path);
        log_explanation(exc);
        relpack_log(debug, "Additional diagnostic details:\n{}", diag_string(diag));
        note_release_stage(stage, man_path);
        write_error_marker(error_marker_of(exc.get_errc()));
        return 1;
    },
    [](std::system_error const&                    exc,
       boost::leaf::verbose_diagnostic_info const& diag,
       e_release_stage const*                      stage,
       e_manifest_path const*                      man_path) {
        relpack_log(error, "I/O error: {}", exc.what());
        relpack_log(debug, "Additional diagnostic details:\n{}", diag_string(diag));
        note_release_stage(stage, man_path);
        write_error_marker("io-error");
        return 1;
    },
    [](std::error_code                             ec,
       boost::leaf::verbose_diagnostic_info const& diag,
       e_release_stage const*                      stage,
       e_manifest_path const*                      man_path) {
        relpack_log(error, "I/O error: {}", ec.message());
        relpack_log(debug, "Additional diagnostic details:\n{}", diag_string(diag));
        note_release_stage(stage, man_path);
        write_error_marker("io-error");
        return 1;
    },
    [](boost::leaf::verbose_diagnostic_info const& diag) {
        relpack_log(critical,
                    "An unhandled error arose. THIS IS A RELPACK BUG! Info: {}",
                    diag_string(diag));
        write_error_marker("bug");
        return 42;
    });

}  // namespace

int relpack::handle_cli_errors(std::function<int()> fn) noexcept {
    return boost::leaf::try_catch(fn, handlers);
}
