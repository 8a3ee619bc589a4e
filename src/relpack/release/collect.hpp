#pragma once

#include <relpack/util/fs/path.hpp>

#include <string>
#include <vector>

namespace relpack {

/// The project directory that could not be listed
struct e_collect_dir {
    fs::path value;
};

/**
 * @brief A file on disk that will be placed in a release archive
 */
struct release_file {
    /// Absolute path of the file to read
    fs::path source;
    /// The '/'-separated path of the file within the archive (before any wrapping directory)
    std::string archive_path;

    friend bool operator==(const release_file&, const release_file&) = default;
};

/// Release files, sorted by archive_path
using release_file_set = std::vector<release_file>;

struct collect_params {
    std::string manifest_filename = "manifest.xml";
    std::string script_extension  = ".lua";
};

/**
 * @brief List the files of a project that belong in its release archive.
 *
 * Only the immediate contents of `project_dir` are considered. The result holds every regular
 * file whose extension is exactly `script_extension`, at most one readme (stored as `README.md`),
 * and the manifest. The manifest is always listed, even if it does not exist yet.
 *
 * A file named `readme.md` in any letter case is a readme. If several exist, the all-lowercase
 * `readme.md` is chosen, otherwise the name that sorts first.
 */
[[nodiscard]] release_file_set collect_release_files(path_ref              project_dir,
                                                     const collect_params& params = {});

}  // namespace relpack
