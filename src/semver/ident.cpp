#include "./ident.hpp"

#include <algorithm>
#include <charconv>
#include <cstdint>

using namespace semver;

namespace {

bool is_ident_char(char c) noexcept {
    return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z')
        || c == '-';
}

bool is_digit(char c) noexcept { return c >= '0' && c <= '9'; }

}  // namespace

ident::ident(std::string_view str) {
    if (str.empty() || !std::all_of(str.begin(), str.end(), is_ident_char)) {
        throw invalid_ident(std::string(str));
    }
    _str.assign(str);

    if (!std::all_of(str.begin(), str.end(), is_digit)) {
        _kind = ident_kind::alphanumeric;
    } else if (str.size() > 1 && str.front() == '0') {
        _kind = ident_kind::digits;
    } else {
        // Numeric identifiers must fit in 64 bits
        std::uint64_t n   = 0;
        auto          res = std::from_chars(str.data(), str.data() + str.size(), n);
        if (res.ec != std::errc{} || res.ptr != str.data() + str.size()) {
            throw invalid_ident(_str);
        }
        _kind = ident_kind::numeric;
    }
}

std::vector<ident> ident::parse_dotted_seq(std::string_view s) {
    std::vector<ident> acc;
    std::size_t        start = 0;
    while (true) {
        auto dot  = s.find('.', start);
        auto part = s.substr(start, dot == s.npos ? s.npos : dot - start);
        if (part.empty()) {
            throw invalid_ident(std::string(s));
        }
        acc.emplace_back(part);
        if (dot == s.npos) {
            break;
        }
        start = dot + 1;
    }
    return acc;
}

std::string semver::join_idents(const std::vector<ident>& ids) {
    std::string acc;
    for (auto& id : ids) {
        if (!acc.empty()) {
            acc.push_back('.');
        }
        acc.append(id.string());
    }
    return acc;
}
