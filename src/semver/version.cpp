#include "./version.hpp"

#include <charconv>

using namespace semver;

namespace {

struct version_reader {
    std::string_view input;
    std::size_t      pos = 0;

    [[noreturn]] void fail() const { throw invalid_version(std::string(input), pos); }

    bool at_end() const noexcept { return pos == input.size(); }
    char peek() const noexcept { return at_end() ? '\0' : input[pos]; }

    int read_component() {
        const auto start = pos;
        while (!at_end() && peek() >= '0' && peek() <= '9') {
            ++pos;
        }
        auto digits = input.substr(start, pos - start);
        if (digits.empty()) {
            fail();
        }
        if (digits.size() > 1 && digits.front() == '0') {
            pos = start;
            fail();
        }
        int  value = 0;
        auto res   = std::from_chars(digits.data(), digits.data() + digits.size(), value);
        if (res.ec != std::errc{}) {
            pos = start;
            fail();
        }
        return value;
    }

    void expect(char c) {
        if (peek() != c) {
            fail();
        }
        ++pos;
    }

    template <typename Tag>
    Tag read_tag(std::string_view tag) {
        try {
            return Tag::parse(tag);
        } catch (const invalid_ident&) {
            fail();
        }
    }

    version read() {
        version ret;
        ret.major = read_component();
        expect('.');
        ret.minor = read_component();
        expect('.');
        ret.patch = read_component();

        if (peek() == '-') {
            ++pos;
            auto plus_pos  = input.find('+', pos);
            auto tag       = input.substr(pos, plus_pos == input.npos ? input.npos : plus_pos - pos);
            ret.prerelease = read_tag<prerelease>(tag);
            pos += tag.size();
        }
        if (peek() == '+') {
            ++pos;
            ret.build_metadata = read_tag<build_metadata>(input.substr(pos));
            pos                = input.size();
        }
        if (!at_end()) {
            fail();
        }
        return ret;
    }
};

}  // namespace

version version::parse(std::string_view s) { return version_reader{s}.read(); }

std::string version::to_string() const {
    auto ret = std::to_string(major) + "." + std::to_string(minor) + "." + std::to_string(patch);
    if (!prerelease.empty()) {
        ret += "-" + prerelease.to_string();
    }
    if (!build_metadata.empty()) {
        ret += "+" + build_metadata.to_string();
    }
    return ret;
}
