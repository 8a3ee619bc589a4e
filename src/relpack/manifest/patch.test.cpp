#include "./patch.hpp"

#include "./error.hpp"

#include <relpack/error/errors.hpp>
#include <relpack/error/try_catch.hpp>

#include <catch2/catch.hpp>

TEST_CASE("Patch the version element") {
    const std::string_view text
        = "<?xml version=\"1.0\"?>\r\n<Tool>\r\n  <!-- keep me -->\r\n"
          "  <Id>x</Id>\r\n  <Version>0.9</Version>\r\n</Tool>\r\n";
    auto patched = relpack::patch_manifest_version(text, "0.9", "0.10.0");
    CHECK(patched
          == "<?xml version=\"1.0\"?>\r\n<Tool>\r\n  <!-- keep me -->\r\n"
             "  <Id>x</Id>\r\n  <Version>0.10.0</Version>\r\n</Tool>\r\n");
}

TEST_CASE("Only the first occurrence is patched") {
    auto patched = relpack::patch_manifest_version(
        "<A><Version>1</Version><B><Version>1</Version></B></A>", "1", "1.1.0");
    CHECK(patched == "<A><Version>1.1.0</Version><B><Version>1</Version></B></A>");
}

TEST_CASE("A version element that does not match literally is an error") {
    auto text = GENERATE(Catch::Generators::values<std::string_view>({
        "<Tool><Version> 0.9 </Version></Tool>",
        "<Tool><Version>0.8</Version></Tool>",
        "<Tool><version>0.9</version></Tool>",
        "",
    }));
    INFO("Patching manifest: " << text);
    relpack_leaf_try {
        (void)relpack::patch_manifest_version(text, "0.9", "0.10.0");
        FAIL_CHECK("Expected an error");
    }
    relpack_leaf_catch(relpack::user_error<relpack::errc::patch_mismatch> const&,
                       relpack::e_patch_pattern pat) {
        CHECK(pat.value == "<Version>0.9</Version>");
    }
    relpack_leaf_catch_all { FAIL_CHECK("Incorrect error: " << diagnostic_info); };
}
