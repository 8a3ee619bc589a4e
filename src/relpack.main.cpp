#include <relpack/cli/dispatch_main.hpp>
#include <relpack/cli/options.hpp>
#include <relpack/util/env.hpp>
#include <relpack/util/log.hpp>

#include <debate/debate.hpp>

#include <boost/leaf.hpp>
#include <fmt/format.h>
#include <fmt/ostream.h>

#include <clocale>
#include <iostream>
#include <locale>
#include <optional>
#include <string>
#include <utility>
#include <vector>

static void load_locale() {
    auto lang = relpack::getenv("LANG");
    if (!lang) {
        return;
    }
    try {
        std::locale::global(std::locale(*lang));
    } catch (const std::runtime_error&) {
        // No locale with the given name
        return;
    }
}

namespace {

/// Print the usage of the parser that rejected the command line, followed by the problem
template <typename... Args>
int usage_error(const debate::argument_parser& parser,
                std::string_view               program_name,
                fmt::format_string<Args...>    message,
                Args&&... args) {
    std::cerr << parser.usage_string(program_name) << '\n';
    fmt::print(std::cerr, message, std::forward<Args>(args)...);
    std::cerr << '\n';
    return 2;
}

/**
 * @brief Parse the command line into `opts`.
 *
 * @return An exit code if the process should stop here (help was printed, or the arguments
 * were rejected), otherwise nullopt.
 */
std::optional<int> parse_command_line(const debate::argument_parser& parser,
                                      std::string_view               program_name,
                                      const std::vector<std::string>& argv) {
    return boost::leaf::try_catch(
        [&]() -> std::optional<int> {
            parser.parse_argv(argv);
            return std::nullopt;
        },
        [&](debate::help_request, debate::e_argument_parser p) -> std::optional<int> {
            std::cout << p.parser.help_string(program_name);
            return 0;
        },
        [&](debate::unrecognized_argument,
            debate::e_argument_parser p,
            debate::e_arg_spelling    arg) -> std::optional<int> {
            return usage_error(p.parser,
                               program_name,
                               "Unrecognized {}: \"{}\"",
                               p.parser.subparsers() ? "argument or subcommand" : "argument",
                               arg.spelling);
        },
        [&](debate::invalid_arguments,
            debate::e_argument          arg,
            debate::e_argument_parser   p,
            debate::e_arg_spelling      spell,
            debate::e_invalid_arg_value val) -> std::optional<int> {
            return usage_error(p.parser,
                               program_name,
                               "'{}' is not a valid {} for '{}'",
                               val.given,
                               arg.argument.valname,
                               spell.spelling);
        },
        [&](debate::missing_required,
            debate::e_argument_parser p,
            debate::e_argument        arg) -> std::optional<int> {
            return usage_error(p.parser,
                               program_name,
                               "Missing required argument '{}'",
                               arg.argument.preferred_spelling());
        },
        [&](debate::invalid_repetition,
            debate::e_argument_parser p,
            debate::e_arg_spelling    sp) -> std::optional<int> {
            return usage_error(p.parser,
                               program_name,
                               "'{}' may only be given once",
                               sp.spelling);
        },
        [&](debate::invalid_arguments const& err,
            debate::e_argument_parser p) -> std::optional<int> {
            return usage_error(p.parser, program_name, "{}", err.what());
        });
}

}  // namespace

int main(int argc, char** argv) {
    relpack::log::init_logger();
    load_locale();
    std::setlocale(LC_CTYPE, ".utf8");

    relpack::cli::options   opts;
    debate::argument_parser parser;
    opts.setup_parser(parser);

    const std::string_view program_name = argv[0];
    if (auto stop = parse_command_line(parser, program_name, {argv + 1, argv + argc})) {
        return *stop;
    }
    relpack::log::current_log_level = opts.log_level;
    relpack_log(debug, "Project directory: [{}]", opts.absolute_project_dir_path().string());
    return relpack::cli::dispatch_main(opts);
}
