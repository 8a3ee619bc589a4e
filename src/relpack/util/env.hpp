#pragma once

#include <optional>
#include <string>

namespace relpack {

/// Obtain the value of an environment variable, or nullopt if it is unset or empty
std::optional<std::string> getenv(const std::string& env) noexcept;

}  // namespace relpack
