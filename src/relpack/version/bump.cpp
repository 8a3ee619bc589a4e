#include "./bump.hpp"

#include <relpack/error/errors.hpp>
#include <relpack/util/log.hpp>

#include <boost/leaf/exception.hpp>

#include <limits>
#include <vector>

using namespace relpack;

std::string relpack::normalize_version(std::string_view s) {
    auto suffix_pos = s.find_first_of("-+");
    auto core       = s.substr(0, suffix_pos);
    auto suffix     = suffix_pos == s.npos ? std::string_view() : s.substr(suffix_pos);

    std::vector<std::string_view> parts;
    while (true) {
        auto dot = core.find('.');
        parts.push_back(core.substr(0, dot));
        if (dot == core.npos) {
            break;
        }
        core = core.substr(dot + 1);
    }
    while (!parts.empty() && parts.back().empty()) {
        parts.pop_back();
    }
    if (parts.empty() || parts.size() > 3) {
        return std::string(s);
    }

    std::string ret;
    for (auto part : parts) {
        if (!ret.empty()) {
            ret.push_back('.');
        }
        ret.append(part);
    }
    for (auto n = parts.size(); n < 3; ++n) {
        ret.append(".0");
    }
    ret.append(suffix);
    return ret;
}

semver::version relpack::parse_manifest_version(std::string_view s) {
    try {
        return semver::version::parse(s);
    } catch (const semver::invalid_version& strict_err) {
        auto normalized = normalize_version(s);
        if (normalized != s) {
            relpack_log(debug, "Version [{}] is not strict, trying [{}]", s, normalized);
            try {
                return semver::version::parse(normalized);
            } catch (const semver::invalid_version&) {
                // Report the error for the text as it was written
            }
        }
        BOOST_LEAF_THROW_EXCEPTION(make_user_error<errc::invalid_version>(
                                       "Invalid version string '{}' (at offset {})",
                                       s,
                                       strict_err.offset()),
                                   e_version_string{std::string(s)},
                                   e_version_offset{strict_err.offset()});
    }
}

semver::version relpack::bump_minor(semver::version v) noexcept {
    v.minor += 1;
    if (!v.is_prerelease() && !v.has_build_metadata()) {
        v.patch = 0;
    }
    return v;
}

semver::version relpack::next_version(std::string_view s) {
    auto cur = parse_manifest_version(s);
    if (cur.minor == std::numeric_limits<int>::max()) {
        BOOST_LEAF_THROW_EXCEPTION(make_user_error<errc::invalid_version>(
                                       "The minor version of '{}' cannot be incremented",
                                       s),
                                   e_version_string{std::string(s)});
    }
    return bump_minor(std::move(cur));
}

std::string relpack::bump_version(std::string_view s) { return next_version(s).to_string(); }
