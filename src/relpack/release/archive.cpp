#include "./archive.hpp"

#include <relpack/error/result.hpp>
#include <relpack/util/fs/io.hpp>
#include <relpack/util/fs/shutil.hpp>
#include <relpack/util/fs/staging.hpp>
#include <relpack/util/log.hpp>
#include <relpack/zip/zip.hpp>

#include <magic_enum.hpp>

using namespace relpack;

std::optional<archive_layout> relpack::parse_archive_layout(std::string_view str) noexcept {
    return magic_enum::enum_cast<archive_layout>(str);
}

std::string relpack::build_release_archive(const release_file_set& files,
                                           archive_layout          layout,
                                           std::string_view        wrap_dir) {
    zip::writer out;
    std::string prefix;
    if (layout == archive_layout::wrapped) {
        prefix = std::string(wrap_dir) + "/";
        out.add_directory(prefix);
    }
    for (auto& file : files) {
        RELPACK_E_SCOPE(zip::e_archive_entry{file.archive_path});
        auto content = relpack::read_file(file.source).value();
        out.add_file(prefix + file.archive_path, content);
    }
    relpack_log(debug,
                "Generated archive with {} entries ({} layout)",
                out.entry_count(),
                magic_enum::enum_name(layout));
    return std::move(out).finish();
}

void relpack::create_release_archive(const release_file_set& files, const archive_params& params) {
    auto dest     = fs::absolute(params.dest);
    auto wrap_dir = params.wrap_dir.empty() ? dest.filename().string() : params.wrap_dir;
    auto bytes    = build_release_archive(files, params.layout, wrap_dir);

    auto staging  = staging_dir::create_beside(dest);
    auto tmp_file = staging.staged_path();
    relpack_log(trace, "Writing archive to staging file [{}]", tmp_file.string());
    relpack::write_file(tmp_file, bytes).value();

    if (relpack::file_exists(dest).value()) {
        relpack_log(debug, "Replacing existing [{}]", dest.string());
    }
    relpack::ensure_absent(dest).value();
    relpack::move_file(tmp_file, dest).value();
    relpack_log(debug, "Wrote {} bytes to [{}]", bytes.size(), dest.string());
}
