#include "./zip.hpp"

#include <relpack/error/errors.hpp>
#include <relpack/error/try_catch.hpp>
#include <relpack/relpack.test.hpp>

#include <catch2/catch.hpp>

#include <cstdint>

namespace zip = relpack::zip;

namespace {

std::string sample_archive() {
    zip::writer w;
    w.add_directory("MyTool.xrnx");
    w.add_file("MyTool.xrnx/main.lua", "print('hello')\n");
    w.add_file("MyTool.xrnx/empty.lua", "");
    return std::move(w).finish();
}

std::uint16_t get_u16(std::string_view bytes, std::size_t pos) {
    return static_cast<std::uint16_t>(static_cast<unsigned char>(bytes[pos])
                                      | (static_cast<unsigned char>(bytes[pos + 1]) << 8));
}

void check_archive_failure(std::string_view bytes) {
    relpack_leaf_try {
        (void)zip::read_archive_bytes(bytes);
        FAIL_CHECK("Expected an error");
    }
    relpack_leaf_catch(relpack::user_error<relpack::errc::archive_failure> const&) {}
    relpack_leaf_catch_all { FAIL_CHECK("Incorrect error: " << diagnostic_info); };
}

}  // namespace

TEST_CASE("Write and read back an archive") {
    auto bytes   = sample_archive();
    auto entries = zip::read_archive_bytes(bytes);
    REQUIRE(entries.size() == 3);

    CHECK(entries[0].path == "MyTool.xrnx/");
    CHECK(entries[0].is_directory());
    CHECK(entries[0].mode == zip::dir_mode);
    CHECK(entries[0].content.empty());

    CHECK(entries[1].path == "MyTool.xrnx/main.lua");
    CHECK_FALSE(entries[1].is_directory());
    CHECK(entries[1].content == "print('hello')\n");
    CHECK(entries[1].mode == zip::file_mode);
    CHECK(entries[1].mtime == zip::fixed_mtime);

    CHECK(entries[2].path == "MyTool.xrnx/empty.lua");
    CHECK(entries[2].content.empty());
}

TEST_CASE("Archive output is deterministic") {
    CHECK(sample_archive() == sample_archive());
}

TEST_CASE("Archive output is a plain ZIP stream") {
    auto bytes = sample_archive();
    REQUIRE(bytes.size() > 22);
    CHECK(bytes.starts_with("PK\x03\x04"));
    // Unblocked output ends with an end-of-central-directory record that has no comment
    auto eocd = bytes.size() - 22;
    CHECK(std::string_view(bytes).substr(eocd, 4) == "PK\x05\x06");
    CHECK(get_u16(bytes, eocd + 10) == 3);
    CHECK(get_u16(bytes, eocd + 20) == 0);
}

TEST_CASE("An empty archive is only an end-of-central-directory record") {
    zip::writer w;
    CHECK(w.entry_count() == 0);
    auto bytes = std::move(w).finish();
    REQUIRE(bytes.size() == 22);
    CHECK(bytes.starts_with("PK\x05\x06"));
}

TEST_CASE("Reject invalid entry paths") {
    auto path = GENERATE(Catch::Generators::values<std::string>({
        "",
        "/abs.lua",
        "dir\\file.lua",
        "a/../b.lua",
        "./a.lua",
        "a//b.lua",
        "trailing/",
    }));
    INFO("Adding entry '" << path << "'");
    zip::writer w;
    relpack_leaf_try {
        w.add_file(path, "content");
        FAIL_CHECK("Expected an error");
    }
    relpack_leaf_catch(relpack::user_error<relpack::errc::archive_failure> const&,
                       zip::e_archive_entry ent) {
        CHECK(ent.value == path);
    }
    relpack_leaf_catch_all { FAIL_CHECK("Incorrect error: " << diagnostic_info); };
    CHECK(w.entry_count() == 0);
}

TEST_CASE("Reject malformed archives") {
    auto good = sample_archive();

    check_archive_failure("");
    check_archive_failure("PK\x05\x06 not really a zip");
    // Cut off within the first entry's name
    check_archive_failure(std::string_view(good).substr(0, 40));

    // Corrupt the compressed content of main.lua. The local header is 30 bytes, followed by the
    // name and the extra field.
    auto name_pos = good.find("MyTool.xrnx/main.lua");
    REQUIRE(name_pos != good.npos);
    REQUIRE(name_pos >= 30);
    auto extra_len = get_u16(good, name_pos - 30 + 28);
    auto data_pos  = name_pos + std::string_view("MyTool.xrnx/main.lua").size() + extra_len;
    auto corrupt   = good;
    corrupt[data_pos + 2] = static_cast<char>(corrupt[data_pos + 2] ^ 0x55);
    check_archive_failure(corrupt);
}

TEST_CASE("Read an archive from a file") {
    relpack::testing::project_fixture proj;
    auto path    = proj.write("out.zip", sample_archive());
    auto entries = zip::read_archive(path);
    CHECK(entries.size() == 3);
}
