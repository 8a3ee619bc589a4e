#pragma once

#include <filesystem>
#include <string>

namespace relpack {

struct e_manifest_path {
    std::filesystem::path value;
};

/**
 * @brief The XML parser's description of why the manifest is not well-formed
 */
struct e_manifest_parse_error {
    std::string message;
    int         line = 0;
};

/**
 * @brief The name of a required manifest element that is absent or blank
 */
struct e_missing_manifest_field {
    std::string value;
};

/**
 * @brief The literal text that was expected in the manifest when rewriting its version
 */
struct e_patch_pattern {
    std::string value;
};

}  // namespace relpack
