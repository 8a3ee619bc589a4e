#include "./errors.hpp"

#include <neo/assert.hpp>

using namespace relpack;

namespace {

std::string error_url_prefix = "https://relpack.readthedocs.io/en/latest/err/";

}  // namespace

std::string relpack::error_reference_of(errc ec) noexcept {
    return error_url_prefix + std::string(error_marker_of(ec)) + ".html";
}

std::string_view relpack::error_marker_of(errc ec) noexcept {
    switch (ec) {
    case errc::manifest_not_found:
        return "manifest-not-found";
    case errc::malformed_manifest:
        return "malformed-manifest";
    case errc::missing_manifest_field:
        return "missing-manifest-field";
    case errc::invalid_version:
        return "invalid-version";
    case errc::patch_mismatch:
        return "patch-mismatch";
    case errc::archive_failure:
        return "archive-failure";
    case errc::none:
        break;
    }
    neo_assert_always(invariant, false, "Unexpected errc while naming an error", int(ec));
}

std::string_view relpack::explanation_of(errc ec) noexcept {
    switch (ec) {
    case errc::manifest_not_found:
        return R"(
relpack must be run from (or pointed at with `--project`) a tool directory that
contains a `manifest.xml` file. Nothing was modified.
)";
    case errc::malformed_manifest:
        return R"(
The manifest file is not well-formed XML. Fix the reported line and rerun.
Nothing was modified.
)";
    case errc::missing_manifest_field:
        return R"(
The manifest must declare a non-empty <Id> element and a non-empty <Version>
element. The <Id> names the release archive and <Version> is bumped on every
release. Nothing was modified.
)";
    case errc::invalid_version:
        return R"(
The <Version> of the manifest must be a semantic version with one to three
numeric components and an optional `-prerelease` and/or `+build` suffix, e.g.
`1`, `1.4`, `1.2.3-beta` or `1.2.3+build5`. Nothing was modified.
)";
    case errc::patch_mismatch:
        return R"(
relpack rewrites only the text `<Version>OLD</Version>` of the manifest so that
comments and formatting are preserved. That exact text could not be found,
usually because the element contains padding whitespace, entities or CDATA.
Write the element on a single line as `<Version>X.Y.Z</Version>` and rerun.
Nothing was modified.
)";
    case errc::archive_failure:
        return R"(
A ZIP archive could not be written or read. relpack writes plain ZIP archives
without ZIP64 extensions, so an archive may hold at most 65535 entries and no
entry or archive may reach 4 GiB. When reading, the file must be a ZIP archive
whose entries are stored or deflated.
)";
    case errc::none:
        break;
    }
    neo_assert_always(invariant, false, "Unexpected errc while explaining an error", int(ec));
}

std::string_view relpack::default_error_string(errc ec) noexcept {
    switch (ec) {
    case errc::manifest_not_found:
        return "No manifest.xml was found in the project directory";
    case errc::malformed_manifest:
        return "The manifest is not a well-formed XML document";
    case errc::missing_manifest_field:
        return "A required manifest field is missing";
    case errc::invalid_version:
        return "The manifest version is not a valid version string";
    case errc::patch_mismatch:
        return "The manifest version element could not be rewritten";
    case errc::archive_failure:
        return "A ZIP archive could not be written or read";
    case errc::none:
        break;
    }
    neo_assert_always(invariant, false, "Unexpected errc while creating a message", int(ec));
}
