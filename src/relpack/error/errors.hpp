#pragma once

#include <fmt/core.h>

#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace relpack {

enum class errc {
    none = 0,
    manifest_not_found,
    malformed_manifest,
    missing_manifest_field,
    invalid_version,
    patch_mismatch,
    archive_failure,
};

std::string      error_reference_of(errc) noexcept;
std::string_view explanation_of(errc) noexcept;
std::string_view default_error_string(errc) noexcept;
/// A short kebab-case name for the error, written by write_error_marker()
std::string_view error_marker_of(errc) noexcept;

struct exception_base : std::runtime_error {
    using runtime_error::runtime_error;
};

struct error_base : exception_base {
    using exception_base::exception_base;

    virtual errc     get_errc() const noexcept = 0;
    std::string      error_reference() const noexcept { return error_reference_of(get_errc()); }
    std::string_view explanation() const noexcept { return explanation_of(get_errc()); }
};

struct external_error_base : error_base {
    using error_base::error_base;
};

struct user_error_base : error_base {
    using error_base::error_base;
};

template <errc ErrorCode>
struct user_error : user_error_base {
    using user_error_base::user_error_base;
    errc get_errc() const noexcept override { return ErrorCode; }
};

template <errc ErrorCode>
struct external_error : external_error_base {
    using external_error_base::external_error_base;
    errc get_errc() const noexcept override { return ErrorCode; }
};

template <errc ErrorCode, typename... Args>
auto make_user_error(std::string_view fmt_str, Args&&... args) {
    return user_error<ErrorCode>(fmt::vformat(fmt_str, fmt::make_format_args(args...)));
}

template <errc ErrorCode>
auto make_user_error() {
    return user_error<ErrorCode>(std::string(default_error_string(ErrorCode)));
}

template <errc ErrorCode, typename... Args>
auto make_external_error(std::string_view fmt_str, Args&&... args) {
    return external_error<ErrorCode>(fmt::vformat(fmt_str, fmt::make_format_args(args...)));
}

template <errc ErrorCode>
auto make_external_error() {
    return external_error<ErrorCode>(std::string(default_error_string(ErrorCode)));
}

}  // namespace relpack
