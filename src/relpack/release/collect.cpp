#include "./collect.hpp"

#include <relpack/error/result.hpp>
#include <relpack/util/log.hpp>
#include <relpack/util/string.hpp>

#include <boost/leaf/exception.hpp>
#include <neo/assert.hpp>

#include <algorithm>
#include <optional>
#include <system_error>

using namespace relpack;

namespace {

constexpr std::string_view readme_name         = "readme.md";
constexpr std::string_view readme_archive_name = "README.md";

[[noreturn]] void throw_listing_error(std::error_code ec, path_ref dir) {
    BOOST_LEAF_THROW_EXCEPTION(std::system_error(ec,
                                                 "Failed to list the contents of the project "
                                                 "directory ["
                                                     + dir.string() + "]"),
                               e_collect_dir{dir});
}

/// The preferred readme among the candidate file names
std::optional<std::string> pick_readme(std::vector<std::string> candidates) {
    if (candidates.empty()) {
        return std::nullopt;
    }
    auto exact = std::ranges::find(candidates, readme_name);
    if (exact != candidates.end()) {
        return *exact;
    }
    return *std::ranges::min_element(candidates);
}

}  // namespace

release_file_set relpack::collect_release_files(path_ref              project_dir,
                                                const collect_params& params) {
    RELPACK_E_SCOPE(e_collect_dir{project_dir});
    auto dir = fs::absolute(project_dir);
    relpack_log(debug, "Collecting release files in [{}]", dir.string());

    release_file_set         ret;
    std::vector<std::string> readmes;

    std::error_code ec;
    auto            iter = fs::directory_iterator{dir, ec};
    if (ec) {
        throw_listing_error(ec, dir);
    }
    for (; iter != fs::directory_iterator{}; iter.increment(ec)) {
        const fs::directory_entry& entry   = *iter;
        const bool                 regular = entry.is_regular_file(ec);
        if (ec) {
            throw_listing_error(ec, entry.path());
        }
        if (!regular) {
            continue;
        }
        auto filename = entry.path().filename().string();
        if (filename == params.manifest_filename) {
            continue;
        }
        if (entry.path().extension() == params.script_extension) {
            relpack_log(trace, "Found script [{}]", filename);
            ret.push_back(release_file{entry.path(), filename});
        } else if (iequals(filename, readme_name)) {
            readmes.push_back(filename);
        }
    }
    if (ec) {
        throw_listing_error(ec, dir);
    }

    if (auto readme = pick_readme(readmes)) {
        if (readmes.size() > 1) {
            relpack_log(warn,
                        "Found {} readme files, only [{}] will be released",
                        readmes.size(),
                        *readme);
        }
        ret.push_back(release_file{dir / *readme, std::string(readme_archive_name)});
    }

    ret.push_back(release_file{dir / params.manifest_filename, params.manifest_filename});

    std::ranges::sort(ret, std::less<>{}, &release_file::archive_path);
    neo_assert(invariant,
               std::ranges::adjacent_find(ret, std::equal_to<>{}, &release_file::archive_path)
                   == ret.end(),
               "Release file set contains duplicate archive paths",
               dir.string());
    return ret;
}
