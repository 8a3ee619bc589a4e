#include "./archive.hpp"

#include <relpack/relpack.test.hpp>
#include <relpack/zip/zip.hpp>

#include <catch2/catch.hpp>

namespace fs = relpack::fs;

namespace {

struct archive_fixture : relpack::testing::project_fixture {
    relpack::release_file_set files;

    archive_fixture() {
        write("manifest.xml", "<Tool><Id>MyTool</Id><Version>1.1.0</Version></Tool>");
        write("main.lua", "print('main')\n");
        write("readme.md", "# MyTool\n");
        files = relpack::collect_release_files(root());
    }
};

}  // namespace

TEST_CASE("Parse archive layout names") {
    CHECK(relpack::parse_archive_layout("flat") == relpack::archive_layout::flat);
    CHECK(relpack::parse_archive_layout("wrapped") == relpack::archive_layout::wrapped);
    CHECK_FALSE(relpack::parse_archive_layout("Flat").has_value());
    CHECK_FALSE(relpack::parse_archive_layout("").has_value());
}

TEST_CASE("Build a wrapped archive") {
    archive_fixture fx;
    auto            dest = fx.root() / "release/MyTool.xrnx";
    relpack::create_release_archive(fx.files, {.dest = dest});

    auto entries = relpack::zip::read_archive(dest);
    REQUIRE(entries.size() == 4);
    CHECK(entries[0].path == "MyTool.xrnx/");
    CHECK(entries[0].is_directory());
    CHECK(entries[1].path == "MyTool.xrnx/README.md");
    CHECK(entries[1].content == "# MyTool\n");
    CHECK(entries[2].path == "MyTool.xrnx/main.lua");
    CHECK(entries[2].content == "print('main')\n");
    CHECK(entries[2].mode == relpack::zip::file_mode);
    CHECK(entries[3].path == "MyTool.xrnx/manifest.xml");

    // Only the archive is left behind in the release directory
    auto n_children = std::distance(fs::directory_iterator{dest.parent_path()},
                                    fs::directory_iterator{});
    CHECK(n_children == 1);
}

TEST_CASE("Build a flat archive") {
    archive_fixture fx;
    auto            dest = fx.root() / "out.zip";
    relpack::create_release_archive(fx.files,
                                    {.dest = dest, .layout = relpack::archive_layout::flat});
    auto entries = relpack::zip::read_archive(dest);
    REQUIRE(entries.size() == 3);
    CHECK(entries[0].path == "README.md");
    CHECK(entries[1].path == "main.lua");
    CHECK(entries[2].path == "manifest.xml");
}

TEST_CASE("Archives are reproducible") {
    archive_fixture fx;
    auto            a = relpack::build_release_archive(fx.files,
                                            relpack::archive_layout::wrapped,
                                            "MyTool.xrnx");
    // Touch the files so that their timestamps change
    fx.write("main.lua", "print('main')\n");
    auto b = relpack::build_release_archive(fx.files,
                                            relpack::archive_layout::wrapped,
                                            "MyTool.xrnx");
    CHECK(a == b);
}

TEST_CASE("A manifest-only release is a valid archive") {
    relpack::testing::project_fixture proj;
    proj.write("manifest.xml", "<Tool/>");
    auto dest = proj.root() / "release/X.xrnx";
    relpack::create_release_archive(relpack::collect_release_files(proj.root()), {.dest = dest});
    auto entries = relpack::zip::read_archive(dest);
    REQUIRE(entries.size() == 2);
    CHECK(entries[1].path == "X.xrnx/manifest.xml");
}

TEST_CASE("Existing files and directories at the destination are replaced") {
    archive_fixture fx;
    auto            dest = fx.root() / "release/MyTool.xrnx";

    SECTION("A directory") {
        fx.write("release/MyTool.xrnx/stale.lua", "old");
    }
    SECTION("A file") {
        fx.write("release/MyTool.xrnx", "not a zip");
    }

    relpack::create_release_archive(fx.files, {.dest = dest});
    CHECK(fs::is_regular_file(dest));
    CHECK(relpack::zip::read_archive(dest).size() == 4);
}

TEST_CASE("An unreadable source file fails without creating the archive") {
    archive_fixture fx;
    fx.files.push_back(relpack::release_file{fx.root() / "missing.lua", "missing.lua"});
    auto dest = fx.root() / "release/MyTool.xrnx";
    CHECK_THROWS(relpack::create_release_archive(fx.files, {.dest = dest}));
    CHECK_FALSE(fs::exists(dest));
}
