#pragma once

#include <semver/ident.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace semver {

/**
 * @brief The dotted tag following a '+' in a version string.
 *
 * Carried through a version bump unchanged.
 */
class build_metadata {
    std::vector<ident> _ids;

public:
    build_metadata() = default;

    [[nodiscard]] bool empty() const noexcept { return _ids.empty(); }

    auto&       idents() const noexcept { return _ids; }
    std::string to_string() const { return join_idents(_ids); }

    static build_metadata parse(std::string_view s) {
        build_metadata ret;
        ret._ids = ident::parse_dotted_seq(s);
        return ret;
    }

    friend bool operator==(const build_metadata& lhs, const build_metadata& rhs) noexcept {
        return lhs._ids == rhs._ids;
    }
};

}  // namespace semver
