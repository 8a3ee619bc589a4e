#pragma once

#include <relpack/util/fs/path.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace relpack {

/**
 * @brief The release-relevant contents of a tool's `manifest.xml`
 *
 * Only `id` and `version` are required. The remaining fields are carried for reporting and are
 * never validated or modified.
 */
struct manifest {
    /// The text of the first <Id> element. Names the release archive.
    std::string id;
    /// The text of the first <Version> element, exactly as written (after trimming).
    std::string version;

    std::optional<std::string> name;
    std::optional<std::string> author;
    std::optional<std::string> description;
    std::optional<std::string> category;
    std::optional<std::string> homepage;
    std::optional<std::string> api_version;
    /// The `doc_version` attribute of the root element
    std::optional<std::string> doc_version;

    /**
     * @brief Parse manifest XML text.
     *
     * Throws `errc::malformed_manifest` if the text is not well-formed, and
     * `errc::missing_manifest_field` if <Id> or <Version> is absent or blank. Unknown elements
     * are ignored. Elements may be nested at any depth; the first in document order is used.
     */
    static manifest parse(std::string_view text);

    /**
     * @brief Read and parse the manifest file at the given path.
     *
     * Throws `errc::manifest_not_found` if there is no such file.
     */
    static manifest from_file(path_ref path);

    /// Obtain a copy of this manifest with a different version string
    [[nodiscard]] manifest with_version(std::string new_version) const {
        auto ret    = *this;
        ret.version = std::move(new_version);
        return ret;
    }
};

}  // namespace relpack
