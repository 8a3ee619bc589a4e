#pragma once

#include "./argument.hpp"

#include <neo/opt_ref.hpp>

#include <functional>
#include <initializer_list>
#include <list>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace debate {

class argument_parser;

struct subparser;

/**
 * @brief A set of named subcommands attached to a parser.
 */
struct subparser_group {
    std::string valname     = "<subcommand>";
    std::string description = {};

    bool required = true;

    const argument_parser* _p_parent = nullptr;
    std::list<subparser>   _p_subparsers{};

    argument_parser& add_parser(subparser);
};

class argument_parser {
    friend struct subparser_group;

    std::list<argument>            _arguments;
    std::optional<subparser_group> _subparsers;
    std::string                    _name;
    std::string                    _description;
    // Set if this parser belongs to a subparser_group. Options of the parent are accepted too.
    neo::opt_ref<const argument_parser> _parent;

    void _parse(const std::vector<std::string_view>& argv) const;

public:
    argument_parser() = default;

    explicit argument_parser(std::string description)
        : _description(std::move(description)) {}

    argument_parser(std::string name, std::string description)
        : _name(std::move(name))
        , _description(std::move(description)) {}

    argument& add_argument(argument arg) noexcept;

    subparser_group& add_subparsers(subparser_group grp = {}) noexcept;

    /**
     * @brief Parse the given command-line arguments (not including the program name), invoking
     * the actions of each argument and subcommand that is matched.
     *
     * Throws a subclass of invalid_arguments for bad input, or help_request if `--help`/`-h`
     * appears.
     */
    template <typename Range>
    void parse_argv(const Range& range) const {
        std::vector<std::string_view> argv;
        for (auto&& arg : range) {
            argv.emplace_back(arg);
        }
        _parse(argv);
    }

    void parse_argv(std::initializer_list<std::string_view> ilist) const {
        _parse(std::vector<std::string_view>(ilist));
    }

    std::string usage_string(std::string_view progname) const noexcept;
    std::string help_string(std::string_view progname) const noexcept;

    auto  parent() const noexcept { return _parent; }
    auto& name() const noexcept { return _name; }
    auto& arguments() const noexcept { return _arguments; }
    auto& subparsers() const noexcept { return _subparsers; }
};

struct subparser {
    std::string name;
    std::string help;

    /// Invoked when this subcommand is selected
    std::function<void()> action{};

    argument_parser _p_parser{name, help};
};

}  // namespace debate
