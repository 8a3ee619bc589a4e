#include "./staging.hpp"

#include <relpack/error/try_catch.hpp>
#include <relpack/relpack.test.hpp>

#include <catch2/catch.hpp>

namespace fs = relpack::fs;

TEST_CASE("A staging directory sits beside its destination") {
    relpack::testing::project_fixture proj;
    auto dest = proj.root() / "release/MyTool.xrnx";

    fs::path dir;
    {
        auto staging = relpack::staging_dir::create_beside(dest);
        dir          = staging.path();
        CHECK(fs::is_directory(dir));
        CHECK(dir.parent_path() == dest.parent_path());
        CHECK(dir.filename().string().starts_with(".MyTool.xrnx.staging-"));
        CHECK(staging.staged_path() == dir / "MyTool.xrnx");

        // Anything left inside is removed along with the directory
        proj.write("release/" + dir.filename().string() + "/MyTool.xrnx", "partial");
    }
    CHECK_FALSE(fs::exists(dir));
    CHECK(fs::is_directory(dest.parent_path()));
    CHECK_FALSE(fs::exists(dest));
}

TEST_CASE("Staging directories are unique") {
    relpack::testing::project_fixture proj;
    auto dest = proj.root() / "out.xrnx";
    auto a    = relpack::staging_dir::create_beside(dest);
    auto b    = relpack::staging_dir::create_beside(dest);
    CHECK(a.path() != b.path());
}

TEST_CASE("A moved staging directory is removed once") {
    relpack::testing::project_fixture proj;
    auto     a = relpack::staging_dir::create_beside(proj.root() / "out.xrnx");
    fs::path dir = a.path();
    {
        auto b = std::move(a);
        CHECK(fs::is_directory(b.path()));
    }
    CHECK_FALSE(fs::exists(dir));
}

TEST_CASE("Fail to create a staging directory under a regular file") {
    relpack::testing::project_fixture proj;
    proj.write("release", "not a directory");
    auto dest = proj.root() / "release/MyTool.xrnx";
    relpack_leaf_try {
        auto staging = relpack::staging_dir::create_beside(dest);
        FAIL_CHECK("Expected an error");
    }
    relpack_leaf_catch(std::system_error const&, relpack::e_staging_parent parent) {
        CHECK(parent.value == dest.parent_path());
    }
    relpack_leaf_catch_all { FAIL_CHECK("Incorrect error: " << diagnostic_info); };
}
