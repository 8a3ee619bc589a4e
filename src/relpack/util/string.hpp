#pragma once

#include <algorithm>
#include <string_view>

namespace relpack {

inline namespace string_utils {

inline bool is_ascii_space(char c) noexcept {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

inline std::string_view trim_view(std::string_view s) noexcept {
    auto b = s.begin();
    auto e = s.end();
    while (b != e && is_ascii_space(*b)) {
        ++b;
    }
    while (e != b && is_ascii_space(*(e - 1))) {
        --e;
    }
    return s.substr(std::size_t(b - s.begin()), std::size_t(e - b));
}

inline char ascii_lower(char c) noexcept { return (c >= 'A' && c <= 'Z') ? char(c - 'A' + 'a') : c; }

inline bool iequals(std::string_view lhs, std::string_view rhs) noexcept {
    return lhs.size() == rhs.size()
        && std::equal(lhs.begin(), lhs.end(), rhs.begin(), [](char a, char b) {
               return ascii_lower(a) == ascii_lower(b);
           });
}

}  // namespace string_utils

}  // namespace relpack
