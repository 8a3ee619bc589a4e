#include "./staging.hpp"

#include <relpack/util/log.hpp>

#include <boost/leaf/exception.hpp>
#include <neo/ufmt.hpp>

#include <cerrno>
#include <cstdlib>
#include <system_error>

using namespace relpack;

struct staging_dir::impl {
    fs::path dir;
    fs::path target_name;

    ~impl() {
        std::error_code ec;
        fs::remove_all(dir, ec);
        if (ec) {
            relpack_log(warn,
                        "Failed to remove staging directory [{}]: {}",
                        dir.string(),
                        ec.message());
        }
    }
};

namespace {

fs::path make_unique_dir(path_ref parent, std::string_view prefix) {
    std::error_code ec;
    fs::create_directories(parent, ec);
    if (!ec) {
        auto name = (parent / neo::ufmt("{}-XXXXXX", prefix)).string();
        if (::mkdtemp(name.data()) != nullptr) {
            return fs::path(name);
        }
        ec = std::error_code(errno, std::system_category());
    }
    BOOST_LEAF_THROW_EXCEPTION(
        std::system_error(ec,
                          neo::ufmt("Failed to create a staging directory in [{}]",
                                    parent.string())),
        e_staging_parent{parent},
        ec);
}

}  // namespace

staging_dir::staging_dir(std::unique_ptr<impl> p) noexcept
    : _impl(std::move(p)) {}

staging_dir::staging_dir(staging_dir&&) noexcept            = default;
staging_dir& staging_dir::operator=(staging_dir&&) noexcept = default;
staging_dir::~staging_dir()                                 = default;

staging_dir staging_dir::create_beside(path_ref dest) {
    auto name = dest.filename().string();
    auto dir  = make_unique_dir(dest.parent_path(), neo::ufmt(".{}.staging", name));
    relpack_log(trace, "Created staging directory [{}]", dir.string());
    return staging_dir(std::unique_ptr<impl>(new impl{std::move(dir), dest.filename()}));
}

staging_dir staging_dir::create_scratch() {
    auto dir = make_unique_dir(fs::temp_directory_path(), "relpack-scratch");
    return staging_dir(std::unique_ptr<impl>(new impl{std::move(dir), fs::path()}));
}

path_ref staging_dir::path() const noexcept { return _impl->dir; }

fs::path staging_dir::staged_path() const { return _impl->dir / _impl->target_name; }
