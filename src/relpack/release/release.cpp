#include "./release.hpp"

#include <relpack/error/errors.hpp>
#include <relpack/error/result.hpp>
#include <relpack/manifest/error.hpp>
#include <relpack/manifest/patch.hpp>
#include <relpack/util/fs/io.hpp>
#include <relpack/util/fs/path.hpp>
#include <relpack/util/log.hpp>
#include <relpack/version/bump.hpp>

#include <boost/leaf/exception.hpp>
#include <magic_enum.hpp>

using namespace relpack;

namespace {

/// Reject an <Id> that would place the archive outside of the release directory
void check_id_is_filename(std::string_view id) {
    if (id == "." || id == ".." || id.find_first_of("/\\") != id.npos) {
        BOOST_LEAF_THROW_EXCEPTION(make_user_error<errc::malformed_manifest>(
                                       "The manifest <Id> '{}' cannot be used as a file name",
                                       id),
                                   e_manifest_parse_error{"Invalid <Id>", 0});
    }
}

}  // namespace

std::string_view relpack::release_stage_name(release_stage st) noexcept {
    return magic_enum::enum_name(st);
}

release_result relpack::create_release(const release_params& params) {
    auto stage            = release_stage::preflight;
    bool manifest_written = false;
    RELPACK_E_SCOPE(e_release_stage{stage, manifest_written});

    const auto project_dir   = resolve_path_weak(params.project_dir);
    const auto manifest_path = project_dir / params.manifest_filename;
    const auto release_dir   = params.release_dir.empty() ? project_dir / "release"
                                                          : resolve_path_weak(params.release_dir);

    RELPACK_E_SCOPE(e_manifest_path{manifest_path});
    if (!relpack::file_exists(manifest_path).value()) {
        BOOST_LEAF_THROW_EXCEPTION(make_user_error<errc::manifest_not_found>(
            "No manifest file found at [{}]",
            manifest_path.string()));
    }

    stage            = release_stage::load_manifest;
    const auto text  = relpack::read_file(manifest_path).value();
    const auto man   = manifest::parse(text);
    check_id_is_filename(man.id);
    relpack_log(debug, "Loaded manifest for [{}] at version {}", man.id, man.version);

    stage                  = release_stage::bump_version;
    const auto new_version = bump_version(man.version);

    stage              = release_stage::patch_manifest;
    const auto patched = patch_manifest_version(text, man.version, new_version);

    release_result ret{
        .manifest     = man.with_version(new_version),
        .old_version  = man.version,
        .new_version  = new_version,
        .archive_path = release_dir / (man.id + "." + params.archive_extension),
        .files        = {},
    };
    relpack_log(info, "Version of [{}]: {} -> {}", man.id, ret.old_version, ret.new_version);

    if (params.dry_run) {
        relpack_log(info, "Dry run: [{}] will not be modified", manifest_path.string());
    } else {
        stage = release_stage::write_manifest;
        relpack::write_file(manifest_path, patched).value();
        manifest_written = true;
        relpack_log(debug, "Updated [{}]", manifest_path.string());
    }

    stage     = release_stage::collect_files;
    ret.files = collect_release_files(project_dir,
                                      collect_params{
                                          .manifest_filename = params.manifest_filename,
                                          .script_extension  = params.script_extension,
                                      });
    for (auto& file : ret.files) {
        relpack_log(debug, "  Release file: {}", file.archive_path);
    }

    if (params.dry_run) {
        relpack_log(info,
                    "Dry run: {} files would be packed into [{}]",
                    ret.files.size(),
                    ret.archive_path.string());
        stage = release_stage::done;
        return ret;
    }

    stage = release_stage::build_archive;
    create_release_archive(ret.files,
                           archive_params{
                               .dest     = ret.archive_path,
                               .layout   = params.layout,
                               .wrap_dir = ret.archive_path.filename().string(),
                           });
    stage = release_stage::done;
    return ret;
}
