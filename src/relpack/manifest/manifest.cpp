#include "./manifest.hpp"

#include "./error.hpp"

#include <relpack/error/errors.hpp>
#include <relpack/error/result.hpp>
#include <relpack/util/fs/io.hpp>
#include <relpack/util/log.hpp>
#include <relpack/util/string.hpp>

#include <boost/leaf/exception.hpp>
#include <libxml/parser.h>
#include <libxml/tree.h>
#include <libxml/xmlerror.h>

#include <climits>
#include <memory>

using namespace relpack;

namespace {

struct xml_doc_deleter {
    void operator()(xmlDoc* doc) const noexcept { ::xmlFreeDoc(doc); }
};

struct xml_ctxt_deleter {
    void operator()(xmlParserCtxt* ctxt) const noexcept { ::xmlFreeParserCtxt(ctxt); }
};

struct xml_string_deleter {
    void operator()(xmlChar* str) const noexcept { ::xmlFree(str); }
};

using unique_xml_doc    = std::unique_ptr<xmlDoc, xml_doc_deleter>;
using unique_xml_ctxt   = std::unique_ptr<xmlParserCtxt, xml_ctxt_deleter>;
using unique_xml_string = std::unique_ptr<xmlChar, xml_string_deleter>;

std::string_view as_view(const xmlChar* str) noexcept {
    return str ? std::string_view(reinterpret_cast<const char*>(str)) : std::string_view();
}

[[noreturn]] void throw_malformed(std::string message, int line) {
    // libxml2 messages end with a newline
    auto trimmed = std::string(trim_view(message));
    BOOST_LEAF_THROW_EXCEPTION(make_user_error<errc::malformed_manifest>(
                                   "The manifest is not well-formed XML (line {}): {}",
                                   line,
                                   trimmed),
                               e_manifest_parse_error{trimmed, line});
}

unique_xml_doc read_document(std::string_view text) {
    if (text.size() > std::size_t(INT_MAX)) {
        throw_malformed("Document is too large", 0);
    }
    unique_xml_ctxt ctxt{::xmlNewParserCtxt()};
    if (!ctxt) {
        throw std::bad_alloc();
    }
    unique_xml_doc doc{::xmlCtxtReadMemory(ctxt.get(),
                                           text.data(),
                                           static_cast<int>(text.size()),
                                           "manifest.xml",
                                           nullptr,
                                           XML_PARSE_NONET | XML_PARSE_NOERROR
                                               | XML_PARSE_NOWARNING)};
    if (!doc || !ctxt->wellFormed) {
        auto err = ::xmlCtxtGetLastError(ctxt.get());
        if (err && err->message) {
            throw_malformed(err->message, err->line);
        }
        throw_malformed("Unknown XML parse error", 0);
    }
    if (!::xmlDocGetRootElement(doc.get())) {
        throw_malformed("Document has no root element", 0);
    }
    return doc;
}

/// Depth-first search for the first element with the given local name, in document order
xmlNode* find_element(xmlNode* node, std::string_view name) noexcept {
    for (; node; node = node->next) {
        if (node->type != XML_ELEMENT_NODE) {
            continue;
        }
        if (as_view(node->name) == name) {
            return node;
        }
        if (auto found = find_element(node->children, name)) {
            return found;
        }
    }
    return nullptr;
}

/// The trimmed text content of the named element, or nullopt if absent or blank
std::optional<std::string> element_text(xmlNode* root, std::string_view name) {
    auto elem = find_element(root, name);
    if (!elem) {
        return std::nullopt;
    }
    unique_xml_string content{::xmlNodeGetContent(elem)};
    auto              text = trim_view(as_view(content.get()));
    if (text.empty()) {
        return std::nullopt;
    }
    return std::string(text);
}

std::string required_text(xmlNode* root, std::string_view name) {
    auto text = element_text(root, name);
    if (!text) {
        BOOST_LEAF_THROW_EXCEPTION(make_user_error<errc::missing_manifest_field>(
                                       "The manifest has no non-empty <{}> element",
                                       name),
                                   e_missing_manifest_field{std::string(name)});
    }
    return std::move(*text);
}

}  // namespace

manifest manifest::parse(std::string_view text) {
    auto doc  = read_document(text);
    auto root = ::xmlDocGetRootElement(doc.get());

    manifest ret;
    ret.id      = required_text(root, "Id");
    ret.version = required_text(root, "Version");

    ret.name        = element_text(root, "Name");
    ret.author      = element_text(root, "Author");
    ret.description = element_text(root, "Description");
    ret.category    = element_text(root, "Category");
    ret.homepage    = element_text(root, "Homepage");
    ret.api_version = element_text(root, "ApiVersion");

    unique_xml_string doc_version{::xmlGetProp(root, reinterpret_cast<const xmlChar*>("doc_version"))};
    if (doc_version) {
        ret.doc_version = std::string(as_view(doc_version.get()));
    }
    return ret;
}

manifest manifest::from_file(path_ref path) {
    RELPACK_E_SCOPE(e_manifest_path{path});
    if (!relpack::file_exists(path).value()) {
        BOOST_LEAF_THROW_EXCEPTION(make_user_error<errc::manifest_not_found>(
            "No manifest file found at [{}]",
            path.string()));
    }
    relpack_log(debug, "Loading manifest from [{}]", path.string());
    auto text = relpack::read_file(path).value();
    return manifest::parse(text);
}
