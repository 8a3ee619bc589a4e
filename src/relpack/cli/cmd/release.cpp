#include "../options.hpp"

#include <relpack/release/release.hpp>
#include <relpack/util/log.hpp>

#include <fmt/ostream.h>

#include <iostream>

namespace relpack::cli::cmd {

namespace {

release_params params_from(const options& opts) {
    auto project = opts.absolute_project_dir_path();
    return release_params{
        .project_dir = project,
        .release_dir = opts.release.out_dir ? fs::absolute(*opts.release.out_dir) : fs::path(),
        .layout      = opts.release.layout,
        .dry_run     = opts.release.dry_run,
    };
}

void print_dry_run(const release_result& res) {
    fmt::print(std::cout, "Would release {} {}\n", res.manifest.id, res.new_version);
    fmt::print(std::cout, "  Version: {} -> {}\n", res.old_version, res.new_version);
    fmt::print(std::cout, "  Archive: {}\n", res.archive_path.string());
    for (auto& file : res.files) {
        fmt::print(std::cout, "    {}\n", file.archive_path);
    }
}

}  // namespace

int release(const options& opts) {
    auto res = create_release(params_from(opts));
    if (opts.release.dry_run) {
        print_dry_run(res);
        return 0;
    }
    relpack_log(debug, "Packed {} files", res.files.size());
    fmt::print(std::cout, "Created {}\n", res.archive_path.string());
    return 0;
}

}  // namespace relpack::cli::cmd
