#include "./manifest.hpp"

#include "./error.hpp"

#include <relpack/error/errors.hpp>
#include <relpack/error/try_catch.hpp>
#include <relpack/relpack.test.hpp>

#include <catch2/catch.hpp>

using relpack::errc;
using relpack::user_error;

namespace {

const std::string_view typical_manifest = R"(<?xml version="1.0" encoding="UTF-8"?>
<RenoiseScriptingTool doc_version="0">
  <!-- A comment that must survive -->
  <ApiVersion>6</ApiVersion>
  <Id>com.example.MyTool</Id>
  <Version>0.9</Version>
  <Author>Someone [someone@example.com]</Author>
  <Name>My Tool</Name>
  <Category>Pattern Editor</Category>
  <Description>Does things &amp; stuff</Description>
  <Homepage>https://example.com</Homepage>
</RenoiseScriptingTool>
)";

}  // namespace

TEST_CASE("Parse a typical manifest") {
    auto man = relpack::manifest::parse(typical_manifest);
    CHECK(man.id == "com.example.MyTool");
    CHECK(man.version == "0.9");
    CHECK(man.name == "My Tool");
    CHECK(man.author == "Someone [someone@example.com]");
    CHECK(man.category == "Pattern Editor");
    CHECK(man.description == "Does things & stuff");
    CHECK(man.homepage == "https://example.com");
    CHECK(man.api_version == "6");
    CHECK(man.doc_version == "0");
}

TEST_CASE("Parse a minimal manifest") {
    auto man = relpack::manifest::parse(
        "<RenoiseScriptingTool><Id>  x  </Id><Version>\n 1.2.3-rc1\n</Version>"
        "</RenoiseScriptingTool>");
    CHECK(man.id == "x");
    CHECK(man.version == "1.2.3-rc1");
    CHECK_FALSE(man.name.has_value());
    CHECK_FALSE(man.doc_version.has_value());
    CHECK_FALSE(man.api_version.has_value());
}

TEST_CASE("Nested and repeated elements use the first in document order") {
    auto man = relpack::manifest::parse(R"(
<Tool>
  <Meta><Id>inner</Id></Meta>
  <Id>outer</Id>
  <Version><![CDATA[2]]></Version>
  <Version>3</Version>
  <Unknown attr="ignored">whatever</Unknown>
</Tool>)");
    CHECK(man.id == "inner");
    CHECK(man.version == "2");
}

TEST_CASE("Missing or blank required fields") {
    struct case_ {
        std::string_view text;
        std::string_view expect_field;
    };
    auto c = GENERATE(Catch::Generators::values<case_>({
        {"<Tool><Version>1.0</Version></Tool>", "Id"},
        {"<Tool><Id>   </Id><Version>1.0</Version></Tool>", "Id"},
        {"<Tool><Id>x</Id></Tool>", "Version"},
        {"<Tool><Id>x</Id><Version/></Tool>", "Version"},
        {"<Tool></Tool>", "Id"},
    }));
    INFO("Parsing manifest: " << c.text);
    relpack_leaf_try {
        relpack::manifest::parse(c.text);
        FAIL_CHECK("Expected an error");
    }
    relpack_leaf_catch(user_error<errc::missing_manifest_field> const&,
                       relpack::e_missing_manifest_field field) {
        CHECK(field.value == c.expect_field);
    }
    relpack_leaf_catch_all { FAIL_CHECK("Incorrect error: " << diagnostic_info); };
}

TEST_CASE("Malformed manifests") {
    auto text = GENERATE(Catch::Generators::values<std::string_view>({
        "",
        "   ",
        "<Tool><Id>x</Id><Version>1.0</Version>",
        "<Tool><Id>x</Version></Tool>",
        "not xml at all",
    }));
    INFO("Parsing manifest: " << text);
    relpack_leaf_try {
        relpack::manifest::parse(text);
        FAIL_CHECK("Expected an error");
    }
    relpack_leaf_catch(user_error<errc::malformed_manifest> const&,
                       relpack::e_manifest_parse_error err) {
        CHECK_FALSE(err.message.empty());
    }
    relpack_leaf_catch_all { FAIL_CHECK("Incorrect error: " << diagnostic_info); };
}

TEST_CASE("Load a manifest from a file") {
    relpack::testing::project_fixture proj;
    auto man_path = proj.write("manifest.xml", typical_manifest);

    auto man = relpack::manifest::from_file(man_path);
    CHECK(man.id == "com.example.MyTool");

    relpack_leaf_try {
        relpack::manifest::from_file(proj.root() / "nope.xml");
        FAIL_CHECK("Expected an error");
    }
    relpack_leaf_catch(user_error<errc::manifest_not_found> const&, relpack::e_manifest_path p) {
        CHECK(p.value == proj.root() / "nope.xml");
    }
    relpack_leaf_catch_all { FAIL_CHECK("Incorrect error: " << diagnostic_info); };
}

TEST_CASE("Parse errors from a file carry the file path") {
    relpack::testing::project_fixture proj;
    auto man_path = proj.write("manifest.xml", "<Tool><Version>1</Version></Tool>");
    relpack_leaf_try {
        relpack::manifest::from_file(man_path);
        FAIL_CHECK("Expected an error");
    }
    relpack_leaf_catch(user_error<errc::missing_manifest_field> const&,
                       relpack::e_manifest_path p) {
        CHECK(p.value == man_path);
    }
    relpack_leaf_catch_all { FAIL_CHECK("Incorrect error: " << diagnostic_info); };
}

TEST_CASE("Replace the version of a manifest") {
    auto man  = relpack::manifest::parse(typical_manifest);
    auto next = man.with_version("0.10.0");
    CHECK(next.version == "0.10.0");
    CHECK(next.id == man.id);
    CHECK(man.version == "0.9");
}
