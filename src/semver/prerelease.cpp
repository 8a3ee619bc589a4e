#include "./prerelease.hpp"

#include <algorithm>

using namespace semver;

prerelease prerelease::parse(std::string_view s) {
    auto ids = ident::parse_dotted_seq(s);
    auto bad = std::find_if(ids.begin(), ids.end(), [](const ident& id) {
        return id.kind() == ident_kind::digits;
    });
    if (bad != ids.end()) {
        throw invalid_ident(bad->string());
    }
    prerelease ret;
    ret._ids = std::move(ids);
    return ret;
}
