#include "./patch.hpp"

#include "./error.hpp"

#include <relpack/error/errors.hpp>
#include <relpack/util/log.hpp>

#include <boost/leaf/exception.hpp>
#include <fmt/core.h>

using namespace relpack;

std::string relpack::patch_manifest_version(std::string_view text,
                                            std::string_view old_version,
                                            std::string_view new_version) {
    auto pattern = fmt::format("<Version>{}</Version>", old_version);
    auto pos     = text.find(pattern);
    if (pos == text.npos) {
        BOOST_LEAF_THROW_EXCEPTION(
            make_user_error<errc::patch_mismatch>(
                "The manifest does not contain the literal text [{}], so its version cannot be "
                "rewritten",
                pattern),
            e_patch_pattern{pattern});
    }

    auto replacement = fmt::format("<Version>{}</Version>", new_version);
    relpack_log(trace, "Replacing [{}] with [{}] at offset {}", pattern, replacement, pos);

    std::string ret;
    ret.reserve(text.size() - pattern.size() + replacement.size());
    ret.append(text.substr(0, pos));
    ret.append(replacement);
    ret.append(text.substr(pos + pattern.size()));
    return ret;
}
