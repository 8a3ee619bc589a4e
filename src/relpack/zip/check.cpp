#include "./check.hpp"

#include <relpack/error/errors.hpp>
#include <relpack/util/log.hpp>

#include <archive.h>
#include <boost/leaf/exception.hpp>

using namespace relpack;

namespace {

std::string_view error_string(::archive* a) noexcept {
    auto str = ::archive_error_string(a);
    return str ? std::string_view(str) : std::string_view("Unknown libarchive error");
}

}  // namespace

void zip::throw_archive_error(::archive* a, std::string_view what) {
    BOOST_LEAF_THROW_EXCEPTION(
        make_user_error<errc::archive_failure>("{} failed: {}", what, error_string(a)));
}

void zip::check_archive(::archive* a, int rc, std::string_view what) {
    if (rc == ARCHIVE_OK) {
        return;
    }
    if (rc == ARCHIVE_WARN) {
        relpack_log(warn, "{}: {}", what, error_string(a));
        return;
    }
    throw_archive_error(a, what);
}
