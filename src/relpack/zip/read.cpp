#include "./check.hpp"
#include "./zip.hpp"

#include <relpack/error/result.hpp>
#include <relpack/util/fs/io.hpp>
#include <relpack/util/log.hpp>

#include <archive.h>
#include <archive_entry.h>

#include <array>
#include <memory>
#include <new>

using namespace relpack;
using namespace relpack::zip;

namespace {

struct read_deleter {
    void operator()(::archive* a) const noexcept { ::archive_read_free(a); }
};

/// Read the remaining content of the current entry. libarchive checks the CRC at its end.
std::string read_content(::archive* a) {
    std::string                ret;
    std::array<char, 1024 * 8> buf;
    while (true) {
        auto n_read = ::archive_read_data(a, buf.data(), buf.size());
        if (n_read == 0) {
            return ret;
        }
        if (n_read < 0) {
            throw_archive_error(a, "Reading the entry content");
        }
        ret.append(buf.data(), static_cast<std::size_t>(n_read));
    }
}

entry read_entry(::archive* a, ::archive_entry* ent) {
    entry ret;
    auto  name = ::archive_entry_pathname_utf8(ent);
    if (!name) {
        name = ::archive_entry_pathname(ent);
    }
    ret.path = name ? name : "";
    RELPACK_E_SCOPE(e_archive_entry{ret.path});
    if (::archive_entry_filetype(ent) == AE_IFDIR && !ret.is_directory()) {
        ret.path.push_back('/');
    }
    ret.mode    = static_cast<std::uint32_t>(::archive_entry_mode(ent));
    ret.mtime   = static_cast<std::int64_t>(::archive_entry_mtime(ent));
    ret.content = read_content(a);
    return ret;
}

}  // namespace

std::vector<entry> zip::read_archive_bytes(std::string_view bytes) {
    std::unique_ptr<::archive, read_deleter> handle{::archive_read_new()};
    if (!handle) {
        throw std::bad_alloc();
    }
    auto a = handle.get();
    check_archive(a, ::archive_read_support_format_zip(a), "Enabling ZIP support");
    check_archive(a,
                  ::archive_read_open_memory(a, bytes.data(), bytes.size()),
                  "Opening the ZIP archive");

    std::vector<entry> ret;
    ::archive_entry*   ent = nullptr;
    while (true) {
        auto rc = ::archive_read_next_header(a, &ent);
        if (rc == ARCHIVE_EOF) {
            break;
        }
        check_archive(a, rc, "Reading an entry header");
        ret.push_back(read_entry(a, ent));
    }
    return ret;
}

std::vector<entry> zip::read_archive(path_ref path) {
    RELPACK_E_SCOPE(e_archive_file{path});
    relpack_log(debug, "Reading ZIP archive [{}]", path.string());
    auto bytes = relpack::read_file(path).value();
    return read_archive_bytes(bytes);
}
