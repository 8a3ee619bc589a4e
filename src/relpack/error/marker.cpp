#include "./marker.hpp"

#include <relpack/error/result.hpp>
#include <relpack/util/env.hpp>
#include <relpack/util/fs/io.hpp>
#include <relpack/util/log.hpp>

#include <boost/leaf/handle_errors.hpp>

void relpack::write_error_marker(std::string_view error) noexcept {
    relpack_log(trace, "[error marker {}]", error);
    auto efile_path = relpack::getenv("RELPACK_WRITE_ERROR_MARKER");
    if (!efile_path) {
        return;
    }
    relpack_log(trace, "[error marker written to [{}]]", *efile_path);
    boost::leaf::try_handle_all(
        [&]() -> result<void> { return relpack::write_file(*efile_path, error); },
        [&](const boost::leaf::error_info&) {
            relpack_log(warn, "Failed to write error marker file [{}]", *efile_path);
        });
}
