#pragma once

#include <exception>
#include <stdexcept>
#include <string>

namespace debate {

struct argument;
class argument_parser;

/// Thrown when `--help` or `-h` is given. Carries e_argument_parser for the active parser.
struct help_request : std::exception {
    const char* what() const noexcept override { return "Help was requested"; }
};

struct invalid_arguments : std::runtime_error {
    using runtime_error::runtime_error;
};

struct unrecognized_argument : invalid_arguments {
    using invalid_arguments::invalid_arguments;
};

struct missing_required : invalid_arguments {
    using invalid_arguments::invalid_arguments;
};

struct invalid_repetition : invalid_arguments {
    using invalid_arguments::invalid_arguments;
};

struct e_argument {
    const debate::argument& argument;
};

/// The innermost parser that was active when the error occurred
struct e_argument_parser {
    const debate::argument_parser& parser;
};

struct e_invalid_arg_value {
    std::string given;
};

struct e_arg_spelling {
    std::string spelling;
};

}  // namespace debate
