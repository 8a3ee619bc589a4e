#include "../options.hpp"

#include <relpack/manifest/manifest.hpp>
#include <relpack/version/bump.hpp>

#include <fmt/ostream.h>

#include <iostream>

namespace relpack::cli::cmd {

int version(const options& opts) {
    auto man  = manifest::from_file(opts.absolute_project_dir_path() / "manifest.xml");
    auto next = bump_version(man.version);
    fmt::print(std::cout, "{}: {} -> {}\n", man.id, man.version, next);
    return 0;
}

}  // namespace relpack::cli::cmd
