#include "./argument.hpp"

#include <neo/ufmt.hpp>

using namespace debate;

using strv = std::string_view;

strv argument::try_match_long(strv tail) const noexcept {
    for (auto& cand : long_spellings) {
        if (!tail.starts_with(cand)) {
            continue;
        }
        // Either '--name' alone or '--name=value'
        auto rest = tail.substr(cand.size());
        if (rest.empty() || rest.front() == '=') {
            return cand;
        }
    }
    return "";
}

strv argument::try_match_short(strv tail) const noexcept {
    for (auto& cand : short_spellings) {
        if (tail.starts_with(cand)) {
            return cand;
        }
    }
    return "";
}

std::string argument::preferred_spelling() const noexcept {
    if (!long_spellings.empty()) {
        return "--" + long_spellings.front();
    }
    if (!short_spellings.empty()) {
        return "-" + short_spellings.front();
    }
    return valname.empty() ? std::string("<value>") : valname;
}

std::string argument::syntax_string() const noexcept {
    auto value = !valname.empty() ? valname
        : long_spellings.empty()  ? std::string("<value>")
                                  : "<" + long_spellings.front() + ">";
    std::string inner;
    if (is_positional()) {
        inner = value;
    } else if (nargs == 0) {
        inner = preferred_spelling();
    } else {
        auto spelling = preferred_spelling();
        inner = neo::ufmt("{}{}{}", spelling, spelling.starts_with("--") ? "=" : " ", value);
    }
    if (can_repeat) {
        inner = neo::ufmt("{} [...]", inner);
    }
    return required ? inner : neo::ufmt("[{}]", inner);
}

std::string argument::help_string() const noexcept {
    std::string ret;
    auto        value = valname.empty() ? std::string("<value>") : valname;
    for (auto& l : long_spellings) {
        ret.append(neo::ufmt("--{}{}\n", l, nargs ? "=" + value : ""));
    }
    for (auto& s : short_spellings) {
        ret.append(neo::ufmt("-{}{}\n", s, nargs ? " " + value : ""));
    }
    if (is_positional()) {
        ret.append(preferred_spelling() + "\n");
    }
    ret.append("  ");
    for (auto c : help) {
        ret.push_back(c);
        if (c == '\n') {
            ret.append("  ");
        }
    }
    ret.push_back('\n');
    return ret;
}
