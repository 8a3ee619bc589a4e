#include "./io.hpp"

#include <relpack/error/result.hpp>

#include <boost/leaf/common.hpp>

#include <cerrno>
#include <fstream>
#include <sstream>
#include <system_error>

using namespace relpack;

result<std::fstream> relpack::open_file(std::filesystem::path const& fpath,
                                        std::ios::openmode           mode) noexcept {
    errno = 0;
    std::fstream ret{fpath, mode};
    auto         e = errno;
    if (!ret) {
        if (e == 0) {
            e = EIO;
        }
        return new_error(boost::leaf::e_errno{e},
                         e_open_file_path{fpath},
                         std::error_code{e, std::system_category()});
    }
    return ret;
}

result<bool> relpack::file_exists(std::filesystem::path const& filepath) noexcept {
    std::error_code ec;
    auto            r = std::filesystem::exists(filepath, ec);
    if (ec) {
        return new_error(e_stat_file_path{filepath}, ec);
    }
    return r;
}

result<void> relpack::write_file(std::filesystem::path const& dest,
                                 std::string_view             content) noexcept {
    RELPACK_E_SCOPE(e_write_file_path{dest});
    BOOST_LEAF_AUTO(outfile, open_file(dest, std::ios::binary | std::ios::out | std::ios::trunc));
    errno = 0;
    outfile.write(content.data(), static_cast<std::streamsize>(content.size()));
    outfile.flush();
    auto e = errno;
    if (!outfile) {
        if (e == 0) {
            e = EIO;
        }
        return new_error(boost::leaf::e_errno{e}, std::error_code(e, std::system_category()));
    }
    return {};
}

result<std::string> relpack::read_file(std::filesystem::path const& path) noexcept {
    RELPACK_E_SCOPE(e_read_file_path{path});
    BOOST_LEAF_AUTO(infile, open_file(path, std::ios::binary | std::ios::in));
    std::ostringstream out;
    out << infile.rdbuf();
    if (infile.bad()) {
        return new_error(boost::leaf::e_errno{EIO}, std::error_code(EIO, std::system_category()));
    }
    return std::move(out).str();
}
