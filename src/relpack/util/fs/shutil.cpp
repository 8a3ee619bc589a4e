#include "./shutil.hpp"
#include "./staging.hpp"

#include <relpack/error/result.hpp>
#include <relpack/util/log.hpp>

#include <boost/leaf/error.hpp>

#include <system_error>

using namespace relpack;

result<void> relpack::ensure_absent(path_ref path) noexcept {
    RELPACK_E_SCOPE(e_remove_file{path});
    std::error_code ec;
    relpack_log(trace, "Recursive ensure-absent [{}]", path.string());
    fs::remove_all(path, ec);
    if (ec) {
        const bool is_enoent = ec == std::errc::no_such_file_or_directory;
        relpack_log(trace,
                    "  Ensure-absent error while removing [{}]: {}{}",
                    path.string(),
                    ec.message(),
                    is_enoent ? " (Ignoring this error)" : "");
        if (not is_enoent) {
            return new_error(ec);
        }
    }
    return {};
}

result<void> relpack::move_file(path_ref source, path_ref dest) {
    std::error_code ec;
    RELPACK_E_SCOPE(e_move_file{source, dest});

    fs::rename(source, dest, ec);
    if (!ec) {
        return {};
    }

    if (ec != std::errc::cross_device_link && ec != std::errc::permission_denied) {
        return new_error(ec);
    }

    relpack_log(debug,
                "Rename of [{}] failed ({}), copying into place instead",
                source.string(),
                ec.message());
    auto staging = staging_dir::create_beside(dest);
    auto staged  = staging.staged_path();
    fs::copy(source, staged, fs::copy_options::recursive, ec);
    if (ec) {
        return new_error(ec);
    }
    fs::rename(staged, dest, ec);
    if (ec) {
        return new_error(ec);
    }
    fs::remove_all(source, ec);
    if (ec) {
        relpack_log(warn,
                    "[{}] was copied into place, but could not be removed afterward: {}",
                    source.string(),
                    ec.message());
    }
    return {};
}
