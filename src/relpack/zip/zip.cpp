#include "./zip.hpp"

#include "./check.hpp"

#include <relpack/error/errors.hpp>
#include <relpack/error/result.hpp>
#include <relpack/util/log.hpp>

#include <archive.h>
#include <archive_entry.h>
#include <boost/leaf/exception.hpp>

#include <cerrno>
#include <ctime>
#include <new>

using namespace relpack;
using namespace relpack::zip;

namespace {

struct entry_deleter {
    void operator()(::archive_entry* e) const noexcept { ::archive_entry_free(e); }
};

la_ssize_t append_bytes(::archive* a, void* out, const void* buf, std::size_t len) {
    try {
        static_cast<std::string*>(out)->append(static_cast<const char*>(buf), len);
    } catch (const std::bad_alloc&) {
        ::archive_set_error(a, ENOMEM, "Out of memory while generating the archive");
        return -1;
    }
    return static_cast<la_ssize_t>(len);
}

void check_entry_path(std::string_view path, bool is_dir) {
    auto bad = [&](std::string_view why) {
        BOOST_LEAF_THROW_EXCEPTION(make_user_error<errc::archive_failure>(
            "Invalid archive entry path '{}': {}",
            path,
            why));
    };
    if (path.empty() || path == "/") {
        bad("The path is empty");
    }
    if (path.front() == '/') {
        bad("The path must be relative");
    }
    if (path.find('\\') != path.npos) {
        bad("The path must use '/' separators");
    }
    if (!is_dir && path.back() == '/') {
        bad("A file path may not end with '/'");
    }
    auto rest = is_dir ? path.substr(0, path.size() - 1) : path;
    while (!rest.empty()) {
        auto slash = rest.find('/');
        auto part  = rest.substr(0, slash);
        if (part.empty() || part == "." || part == "..") {
            bad("The path contains an empty, '.' or '..' component");
        }
        rest = slash == rest.npos ? std::string_view() : rest.substr(slash + 1);
    }
}

}  // namespace

void archive_write_deleter::operator()(::archive* a) const noexcept { ::archive_write_free(a); }

writer::writer(int level)
    : _bytes(std::make_unique<std::string>())
    , _archive(::archive_write_new()) {
    if (!_archive) {
        throw std::bad_alloc();
    }
    auto a = _archive.get();
    check_archive(a, ::archive_write_set_format_zip(a), "Selecting the ZIP format");
    check_archive(a, ::archive_write_zip_set_compression_deflate(a), "Selecting deflate");
    check_archive(a,
                  ::archive_write_set_format_option(a,
                                                    "zip",
                                                    "compression-level",
                                                    std::to_string(level).c_str()),
                  "Setting the compression level");
    check_archive(a,
                  ::archive_write_set_format_option(a, "zip", "hdrcharset", "UTF-8"),
                  "Selecting UTF-8 entry names");
    // No blocking: the output ends exactly at the end of the central directory
    check_archive(a, ::archive_write_set_bytes_per_block(a, 0), "Disabling output blocking");
    check_archive(a,
                  ::archive_write_open(a, _bytes.get(), nullptr, append_bytes, nullptr),
                  "Opening the archive");
}

void writer::_add(std::string_view path, std::string_view content, bool is_dir) {
    RELPACK_E_SCOPE(e_archive_entry{std::string(path)});
    check_entry_path(path, is_dir);

    std::unique_ptr<::archive_entry, entry_deleter> ent{::archive_entry_new()};
    if (!ent) {
        throw std::bad_alloc();
    }
    ::archive_entry_set_pathname_utf8(ent.get(), std::string(path).c_str());
    ::archive_entry_set_mode(ent.get(), is_dir ? dir_mode : file_mode);
    ::archive_entry_set_size(ent.get(), static_cast<la_int64_t>(content.size()));
    ::archive_entry_set_mtime(ent.get(), static_cast<time_t>(fixed_mtime), 0);
    ::archive_entry_set_uid(ent.get(), 0);
    ::archive_entry_set_gid(ent.get(), 0);

    auto a = _archive.get();
    check_archive(a, ::archive_write_header(a, ent.get()), "Writing the entry header");
    if (!content.empty()) {
        auto n_written = ::archive_write_data(a, content.data(), content.size());
        if (n_written < 0 || static_cast<std::size_t>(n_written) != content.size()) {
            throw_archive_error(a, "Writing the entry content");
        }
    }
    check_archive(a, ::archive_write_finish_entry(a), "Finishing the entry");
    ++_n_entries;
    relpack_log(trace, "Added archive entry [{}] ({} bytes)", path, content.size());
}

void writer::add_directory(std::string_view path) {
    std::string dir{path};
    if (!dir.ends_with('/')) {
        dir.push_back('/');
    }
    _add(dir, "", true);
}

void writer::add_file(std::string_view path, std::string_view content) {
    _add(path, content, false);
}

std::string writer::finish() && {
    auto a = _archive.get();
    check_archive(a, ::archive_write_close(a), "Writing the central directory");
    _archive.reset();
    return std::move(*_bytes);
}
