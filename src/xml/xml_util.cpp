#include "xml/xml_util.hpp"

#include <libxml/xmlversion.h>

#include <climits>

namespace epubdiff::xml {

namespace {

struct ParserCtxtFree {
    void operator()(xmlParserCtxt* ctxt) const { xmlFreeParserCtxt(ctxt); }
};

using ParserCtxtPtr = std::unique_ptr<xmlParserCtxt, ParserCtxtFree>;

// Errors go to collect_error instead of stderr
constexpr int PARSE_OPTIONS = XML_PARSE_NONET | XML_PARSE_IGNORE_ENC;

#if LIBXML_VERSION >= 21200
using ErrorPtr = const xmlError*;
#else
using ErrorPtr = xmlErrorPtr;
#endif

struct ErrorSink {
    std::string first_fatal;
    std::vector<Diagnostic> diagnostics;
};

std::string trim_message(const char* message) {
    std::string result = message ? message : "";
    while (!result.empty() && (result.back() == '\n' || result.back() == '\r')) {
        result.pop_back();
    }
    return result;
}

// Structured error handler; data is the parser context (its userData)
void collect_error(void* data, ErrorPtr error) {
    auto* ctxt = static_cast<xmlParserCtxt*>(data);
    if (!ctxt || !ctxt->_private || !error) return;
    auto* sink = static_cast<ErrorSink*>(ctxt->_private);

    std::string message = trim_message(error->message);
    if (error->level == XML_ERR_FATAL) {
        if (sink->first_fatal.empty()) {
            sink->first_fatal = "line " + std::to_string(error->line) + ": " + message;
        }
        return;
    }
    sink->diagnostics.push_back({error->code, error->line, std::move(message)});
}

bool is_element(const xmlNode* node) {
    return node && node->type == XML_ELEMENT_NODE;
}

void collect_descendants(xmlNode* node, const std::string& name,
                         const std::string* ns, std::vector<xmlNode*>& out) {
    for (xmlNode* child = node->children; child; child = child->next) {
        if (!is_element(child)) continue;
        if (local_name(child) == name && (!ns || namespace_uri(child) == *ns)) {
            out.push_back(child);
        }
        collect_descendants(child, name, ns, out);
    }
}

} // namespace

ParseResult parse(const std::string& text, const std::string& name) {
    ParseResult result;

    if (text.size() > static_cast<size_t>(INT_MAX)) {
        result.error = "document too large";
        return result;
    }

    ParserCtxtPtr ctxt(xmlNewParserCtxt());
    if (!ctxt) {
        result.error = "xmlNewParserCtxt failed";
        return result;
    }

    ErrorSink sink;
    ctxt->_private = &sink;
    ctxt->sax->serror = collect_error;

    result.doc.reset(xmlCtxtReadMemory(ctxt.get(), text.data(), static_cast<int>(text.size()),
                                       name.c_str(), "UTF-8", PARSE_OPTIONS));
    ctxt->_private = nullptr;
    result.diagnostics = std::move(sink.diagnostics);

    if (!result.doc || !ctxt->wellFormed) {
        result.doc.reset();
        result.error = sink.first_fatal.empty() ? "not well-formed" : sink.first_fatal;
        return result;
    }

    if (!xmlDocGetRootElement(result.doc.get())) {
        result.doc.reset();
        result.error = "no root element";
        return result;
    }

    result.ok = true;
    return result;
}

xmlNode* root_element(const ParseResult& parsed) {
    if (!parsed.doc) return nullptr;
    return xmlDocGetRootElement(parsed.doc.get());
}

std::string local_name(const xmlNode* node) {
    if (!node || !node->name) return {};
    return reinterpret_cast<const char*>(node->name);
}

std::string namespace_uri(const xmlNode* node) {
    if (!node || !node->ns || !node->ns->href) return {};
    return reinterpret_cast<const char*>(node->ns->href);
}

std::vector<xmlNode*> find_descendants(xmlNode* node, const std::string& name) {
    std::vector<xmlNode*> out;
    if (node) collect_descendants(node, name, nullptr, out);
    return out;
}

std::vector<xmlNode*> find_descendants_ns(xmlNode* node, const std::string& name,
                                          const std::string& ns) {
    std::vector<xmlNode*> out;
    if (node) collect_descendants(node, name, &ns, out);
    return out;
}

std::vector<xmlNode*> find_children_ns(xmlNode* node, const std::string& name,
                                       const std::string& ns) {
    std::vector<xmlNode*> out;
    if (!node) return out;
    for (xmlNode* child = node->children; child; child = child->next) {
        if (is_element(child) && local_name(child) == name && namespace_uri(child) == ns) {
            out.push_back(child);
        }
    }
    return out;
}

std::optional<std::string> attribute(const xmlNode* node, const std::string& name) {
    if (!node) return std::nullopt;
    xmlChar* value = xmlGetNoNsProp(node, reinterpret_cast<const xmlChar*>(name.c_str()));
    if (!value) return std::nullopt;
    std::string result(reinterpret_cast<const char*>(value));
    xmlFree(value);
    return result;
}

} // namespace epubdiff::xml
