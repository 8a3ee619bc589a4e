#include "./dispatch_main.hpp"

#include "./error_handler.hpp"
#include "./options.hpp"

#include <relpack/error/result.hpp>

#include <neo/assert.hpp>

using namespace relpack;

namespace relpack::cli {

namespace cmd {
using command = int(const options&);

command release;
command version;
command ls;

}  // namespace cmd

int dispatch_main(const options& opts) noexcept {
    return relpack::handle_cli_errors([&] {
        RELPACK_E_SCOPE(opts.subcommand);
        switch (opts.subcommand) {
        case subcommand::release:
            return cmd::release(opts);
        case subcommand::version:
            return cmd::version(opts);
        case subcommand::ls:
            return cmd::ls(opts);
        case subcommand::_none_:;
        }
        neo::unreachable();
    });
}

}  // namespace relpack::cli
