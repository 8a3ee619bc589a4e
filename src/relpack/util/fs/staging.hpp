#pragma once

#include "./path.hpp"

#include <memory>

namespace relpack {

/// The directory in which a staging directory could not be created
struct e_staging_parent {
    fs::path value;
};

/**
 * @brief A uniquely-named hidden directory used to assemble a file before it is renamed into its
 * final place. The directory and anything left inside it are removed when the handle is
 * destroyed.
 *
 * A staging directory created with create_beside() lives in the same directory as the final
 * destination, so moving the staged file into place is a rename on one filesystem.
 */
class staging_dir {
    struct impl;
    std::unique_ptr<impl> _impl;

    explicit staging_dir(std::unique_ptr<impl>) noexcept;

public:
    staging_dir(staging_dir&&) noexcept;
    staging_dir& operator=(staging_dir&&) noexcept;
    ~staging_dir();

    /**
     * @brief Create a staging directory for `dest` within dest's parent directory, creating the
     * parent if needed.
     *
     * Throws std::system_error with an e_staging_parent on failure.
     */
    [[nodiscard]] static staging_dir create_beside(path_ref dest);

    /// Create a scratch directory in the system's temporary directory
    [[nodiscard]] static staging_dir create_scratch();

    /// The staging directory itself
    path_ref path() const noexcept;

    /// The path at which to assemble the file before moving it to the destination
    fs::path staged_path() const;
};

}  // namespace relpack
