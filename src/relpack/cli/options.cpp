#include "./options.hpp"

#include <relpack/util/env.hpp>
#include <relpack/util/fs/path.hpp>

#include <debate/debate.hpp>
#include <magic_enum.hpp>

using namespace relpack;
using namespace debate;

namespace {

struct setup {
    relpack::cli::options& opts;

    explicit setup(relpack::cli::options& opts)
        : opts(opts) {}

    argument layout_arg{
        .long_spellings = {"layout"},
        .help = "How files are placed in the archive. 'wrapped' (the default) places every file\n"
                "in a top-level '<Id>.xrnx/' directory. 'flat' places them at the root.\n"
                "The default can be set with the RELPACK_LAYOUT environment variable.",
        .valname = "{wrapped,flat}",
        .action  = put_into(opts.release.layout),
    };

    argument out_arg{
        .long_spellings  = {"out", "output"},
        .short_spellings = {"o"},
        .help            = "Directory in which to place the archive. Default is <project>/release",
        .valname         = "<dir>",
        .action          = put_into(opts.release.out_dir),
    };

    argument dry_run_arg{
        .long_spellings = {"dry-run"},
        .help           = "Report the new version and the files to release, but modify nothing",
        .nargs          = 0,
        .action         = store_true(opts.release.dry_run),
    };

    void do_setup(argument_parser& parser) noexcept {
        parser.add_argument({
            .long_spellings  = {"log-level"},
            .short_spellings = {"l"},
            .help            = "Set the relpack logging level. One of 'trace', 'debug', 'info', \n"
                               "'warn', 'error', 'critical', or 'silent'",
            .valname         = "<level>",
            .action          = put_into(opts.log_level),
        });
        parser.add_argument({
            .long_spellings  = {"project"},
            .short_spellings = {"p"},
            .help     = "The tool directory containing manifest.xml. Default is the working directory",
            .valname  = "<project-dir>",
            .action   = put_into(opts.project_dir),
        });

        auto& group = parser.add_subparsers({
            .valname     = "<relpack-subcommand>",
            .description = "The operation to perform",
            .required    = true,
        });
        setup_release_cmd(group.add_parser({
            .name   = "release",
            .help   = "Bump the minor version in the manifest and create a release archive",
            .action = store_value(opts.subcommand, cli::subcommand::release),
        }));
        group.add_parser({
            .name   = "version",
            .help   = "Print the current version and the version the next release will have",
            .action = store_value(opts.subcommand, cli::subcommand::version),
        });
        setup_ls_cmd(group.add_parser({
            .name   = "ls",
            .help   = "List the contents of a release archive",
            .action = store_value(opts.subcommand, cli::subcommand::ls),
        }));
    }

    void setup_release_cmd(argument_parser& release_cmd) noexcept {
        release_cmd.add_argument(layout_arg);
        release_cmd.add_argument(out_arg);
        release_cmd.add_argument(dry_run_arg);
    }

    void setup_ls_cmd(argument_parser& ls_cmd) noexcept {
        ls_cmd.add_argument({
            .help     = "Path to a release archive",
            .valname  = "<archive>",
            .required = true,
            .action   = put_into(opts.ls.archive),
        });
    }
};

}  // namespace

cli::options::options() noexcept {
    if (auto env_level = relpack::getenv("RELPACK_LOG_LEVEL")) {
        if (auto lvl = magic_enum::enum_cast<log::level>(*env_level)) {
            log_level = *lvl;
        } else {
            relpack_log(warn, "Ignoring unknown RELPACK_LOG_LEVEL value '{}'", *env_level);
        }
    }
    if (auto env_layout = relpack::getenv("RELPACK_LAYOUT")) {
        if (auto layout = parse_archive_layout(*env_layout)) {
            release.layout = *layout;
        } else {
            relpack_log(warn, "Ignoring unknown RELPACK_LAYOUT value '{}'", *env_layout);
        }
    }
}

fs::path cli::options::absolute_project_dir_path() const noexcept {
    return relpack::resolve_path_weak(project_dir);
}

void cli::options::setup_parser(debate::argument_parser& parser) noexcept {
    setup{*this}.do_setup(parser);
}
