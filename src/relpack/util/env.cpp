#include "./env.hpp"

#include <cstdlib>

std::optional<std::string> relpack::getenv(const std::string& varname) noexcept {
    auto cptr = std::getenv(varname.data());
    if (cptr && *cptr != '\0') {
        return std::string(cptr);
    }
    return {};
}
