#include "./argument_parser.hpp"

#include <boost/leaf/exception.hpp>
#include <boost/leaf/on_error.hpp>
#include <neo/assert.hpp>
#include <neo/ufmt.hpp>

#include <algorithm>
#include <set>

using namespace debate;

using strv = std::string_view;

namespace {

struct parse_engine {
    const std::vector<strv>& argv;
    const argument_parser*   bottom_parser;

    std::size_t index            = 0;
    int         positional_index = 0;
    bool        options_ended    = false;

    std::set<const argument*> seen{};

    bool at_end() const noexcept { return index == argv.size(); }
    strv current() const noexcept {
        neo_assert(invariant, !at_end(), "Read past the end of argv", index);
        return argv[index];
    }
    void shift() noexcept { ++index; }

    void see(const argument& arg) {
        if (!seen.insert(&arg).second && !arg.can_repeat) {
            BOOST_LEAF_THROW_EXCEPTION(invalid_repetition("Argument given more than once"),
                                       e_argument{arg});
        }
    }

    void run() {
        auto _ = boost::leaf::on_error([this] { return e_argument_parser{*bottom_parser}; });
        while (!at_end()) {
            auto given = current();
            if (!parse_one(given)) {
                BOOST_LEAF_THROW_EXCEPTION(unrecognized_argument("Unrecognized argument"),
                                           e_arg_spelling{std::string(given)});
            }
        }
        finalize();
    }

    bool parse_one(strv given) {
        if (options_ended || given.size() < 2 || given[0] != '-') {
            return parse_positional(given) || parse_subcommand(given);
        }
        if (given == "--") {
            options_ended = true;
            shift();
            return true;
        }
        if (given[1] == '-') {
            return parse_long(given.substr(2));
        }
        return parse_short_group(given.substr(1));
    }

    void invoke_with_value(const argument& arg, strv value, strv spelling) {
        auto _ = boost::leaf::on_error(e_argument{arg}, e_arg_spelling{std::string(spelling)});
        see(arg);
        arg.action(value, spelling);
    }

    /// Find an option in the active parser or any of its parents
    template <typename Match>
    std::pair<const argument*, strv> find_option(Match&& match) const {
        for (auto p = bottom_parser; p; p = p->parent().pointer()) {
            for (const argument& cand : p->arguments()) {
                if (cand.is_positional()) {
                    continue;
                }
                auto matched = match(cand);
                if (!matched.empty()) {
                    return {&cand, matched};
                }
            }
        }
        return {nullptr, {}};
    }

    bool parse_long(strv tail) {
        if (tail == "help") {
            throw_help();
        }
        auto [arg, matched] = find_option([&](const argument& a) { return a.try_match_long(tail); });
        if (!arg) {
            return false;
        }
        shift();
        auto spelling = neo::ufmt("--{}", matched);
        auto rest     = tail.substr(matched.size());
        if (arg->nargs == 0) {
            if (!rest.empty()) {
                BOOST_LEAF_THROW_EXCEPTION(invalid_arguments("Argument does not take a value"),
                                           e_argument{*arg},
                                           e_arg_spelling{spelling});
            }
            invoke_with_value(*arg, "", spelling);
        } else if (!rest.empty()) {
            // '--name=value'
            invoke_with_value(*arg, rest.substr(1), spelling);
        } else {
            // '--name value'
            if (at_end()) {
                BOOST_LEAF_THROW_EXCEPTION(invalid_arguments("Expected a value"),
                                           e_argument{*arg},
                                           e_arg_spelling{spelling});
            }
            invoke_with_value(*arg, current(), spelling);
            shift();
        }
        return true;
    }

    bool parse_short_group(strv group) {
        if (group == "h") {
            throw_help();
        }
        bool consumed_any = false;
        while (!group.empty()) {
            auto [arg, matched]
                = find_option([&](const argument& a) { return a.try_match_short(group); });
            if (!arg) {
                if (consumed_any) {
                    BOOST_LEAF_THROW_EXCEPTION(unrecognized_argument("Unrecognized argument"),
                                               e_arg_spelling{neo::ufmt("-{}", group)});
                }
                return false;
            }
            auto spelling = neo::ufmt("-{}", matched);
            group.remove_prefix(matched.size());
            consumed_any = true;
            if (arg->nargs == 0) {
                // Switches may be grouped, as in '-abc'
                invoke_with_value(*arg, "", spelling);
                continue;
            }
            if (!group.empty()) {
                // '-lvalue'
                invoke_with_value(*arg, group, spelling);
                shift();
                return true;
            }
            // '-l value'
            shift();
            if (at_end()) {
                BOOST_LEAF_THROW_EXCEPTION(invalid_arguments("Expected a value"),
                                           e_argument{*arg},
                                           e_arg_spelling{spelling});
            }
            invoke_with_value(*arg, current(), spelling);
            shift();
            return true;
        }
        shift();
        return true;
    }

    bool parse_positional(strv given) {
        int pos_idx = 0;
        for (auto& arg : bottom_parser->arguments()) {
            if (!arg.is_positional()) {
                continue;
            }
            if (pos_idx++ != positional_index) {
                continue;
            }
            neo_assert(expects,
                       arg.nargs == 1,
                       "Positional arguments take exactly one value",
                       arg.nargs,
                       given);
            invoke_with_value(arg, given, arg.preferred_spelling());
            if (!arg.can_repeat) {
                ++positional_index;
            }
            shift();
            return true;
        }
        return false;
    }

    bool parse_subcommand(strv given) {
        auto& group = bottom_parser->subparsers();
        if (!group) {
            return false;
        }
        for (auto& cand : group->_p_subparsers) {
            if (cand.name != given) {
                continue;
            }
            if (cand.action) {
                cand.action();
            }
            bottom_parser    = &cand._p_parser;
            positional_index = 0;
            shift();
            return true;
        }
        return false;
    }

    [[noreturn]] void throw_help() const { BOOST_LEAF_THROW_EXCEPTION(help_request()); }

    void finalize() const {
        for (auto p = bottom_parser; p; p = p->parent().pointer()) {
            for (auto& arg : p->arguments()) {
                if (arg.required && !seen.contains(&arg)) {
                    BOOST_LEAF_THROW_EXCEPTION(missing_required("A required argument is missing"),
                                               e_argument{arg});
                }
            }
        }
        if (bottom_parser->subparsers() && bottom_parser->subparsers()->required) {
            BOOST_LEAF_THROW_EXCEPTION(missing_required("Expected a subcommand"));
        }
    }
};

}  // namespace

void argument_parser::_parse(const std::vector<strv>& argv) const {
    parse_engine{argv, this}.run();
}

argument& argument_parser::add_argument(argument arg) noexcept {
    _arguments.push_back(std::move(arg));
    return _arguments.back();
}

subparser_group& argument_parser::add_subparsers(subparser_group grp) noexcept {
    _subparsers.emplace(std::move(grp));
    _subparsers->_p_parent = this;
    return *_subparsers;
}

argument_parser& subparser_group::add_parser(subparser sub) {
    _p_subparsers.push_back(std::move(sub));
    auto& p   = _p_subparsers.back()._p_parser;
    p._name   = _p_subparsers.back().name;
    p._parent = _p_parent;
    return p;
}

std::string argument_parser::usage_string(std::string_view progname) const noexcept {
    std::string command;
    for (auto p = this; p; p = p->_parent.pointer()) {
        if (!p->_name.empty()) {
            command = " " + p->_name + command;
        }
    }
    auto        ret    = neo::ufmt("Usage: {}{}", progname, command);
    std::size_t indent = std::min(ret.size() + 1, std::size_t(24));
    std::size_t col    = ret.size();

    auto append_word = [&](const std::string& word) {
        if (col + word.size() + 1 > 79 && col > indent) {
            ret.append("\n");
            ret.append(indent - 1, ' ');
            col = indent - 1;
        }
        ret.append(" " + word);
        col += word.size() + 1;
    };

    for (auto& arg : _arguments) {
        append_word(arg.syntax_string());
    }
    if (_subparsers) {
        std::string names;
        for (auto& sub : _subparsers->_p_subparsers) {
            names.append(names.empty() ? "{" : ",");
            names.append(sub.name);
        }
        append_word(names + "}");
    }
    return ret;
}

std::string argument_parser::help_string(std::string_view progname) const noexcept {
    auto ret = usage_string(progname) + "\n\n";
    if (!_description.empty()) {
        ret.append(_description + "\n\n");
    }
    for (bool want_required : {true, false}) {
        bool any = false;
        for (auto& arg : _arguments) {
            if (arg.required != want_required) {
                continue;
            }
            if (!any) {
                ret.append(want_required ? "required arguments:\n\n" : "optional arguments:\n\n");
                any = true;
            }
            ret.append(arg.help_string() + "\n");
        }
    }
    if (_subparsers) {
        ret.append("Subcommands:\n\n");
        if (!_subparsers->description.empty()) {
            ret.append(neo::ufmt("  {}\n\n", _subparsers->description));
        }
        for (auto& sub : _subparsers->_p_subparsers) {
            ret.append(neo::ufmt("{}\n  {}\n\n", sub.name, sub.help));
        }
    }
    return ret;
}
