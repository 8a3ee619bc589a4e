#include "./path.hpp"

#include <system_error>

using namespace relpack;

fs::path relpack::normalize_path(path_ref p_) noexcept {
    auto p = p_.lexically_normal();
    while (!p.empty() && p.filename().empty() && p.has_relative_path()) {
        p = p.parent_path();
    }
    return p;
}

fs::path relpack::resolve_path_weak(path_ref p) noexcept {
    std::error_code ec;
    auto            abs = fs::weakly_canonical(p, ec);
    if (ec) {
        // Fall back to a purely lexical absolute path
        abs = fs::absolute(p, ec);
        if (ec) {
            abs = p;
        }
    }
    return normalize_path(abs);
}
