#include "../options.hpp"

#include <relpack/zip/zip.hpp>

#include <fmt/ostream.h>

#include <iostream>

namespace relpack::cli::cmd {

int ls(const options& opts) {
    auto entries = zip::read_archive(opts.ls.archive);
    for (auto& ent : entries) {
        fmt::print(std::cout,
                   "{:06o} {:>10}  {}\n",
                   ent.mode,
                   ent.content.size(),
                   ent.path);
    }
    return 0;
}

}  // namespace relpack::cli::cmd
