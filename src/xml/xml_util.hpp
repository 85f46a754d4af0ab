#pragma once

#include <libxml/parser.h>
#include <libxml/tree.h>
#include <libxml/xmlerror.h>

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace epubdiff::xml {

// ============================================================================
// libxml2 helpers shared by the container, package and markup modules
// ============================================================================

struct DocFree {
    void operator()(xmlDoc* doc) const { xmlFreeDoc(doc); }
};

using DocPtr = std::unique_ptr<xmlDoc, DocFree>;

// A non-fatal diagnostic raised while parsing
struct Diagnostic {
    int code = 0;           // xmlParserErrors value
    int line = 0;
    std::string message;
};

struct ParseResult {
    bool ok = false;
    std::string error;      // "line N: message" when not well-formed
    DocPtr doc;
    std::vector<Diagnostic> diagnostics;
};

// Parse a complete XML document from memory. The text must already be UTF-8;
// any encoding declaration in it is ignored. Network access and DTD loading
// are disabled and nothing is printed to stderr.
ParseResult parse(const std::string& text, const std::string& name = "document.xml");

// Root element of a parsed document (nullptr if none)
xmlNode* root_element(const ParseResult& parsed);

// Element local name (no prefix)
std::string local_name(const xmlNode* node);

// Namespace URI of an element, empty when the element has no namespace
std::string namespace_uri(const xmlNode* node);

// Every descendant element (excluding node itself) with the given local name,
// in document order, regardless of namespace
std::vector<xmlNode*> find_descendants(xmlNode* node, const std::string& name);

// Every descendant element (excluding node itself) with the given local name
// whose namespace URI equals ns ("" matches elements without a namespace)
std::vector<xmlNode*> find_descendants_ns(xmlNode* node, const std::string& name,
                                          const std::string& ns);

// Direct child elements with the given local name and namespace URI
std::vector<xmlNode*> find_children_ns(xmlNode* node, const std::string& name,
                                       const std::string& ns);

// Value of an attribute that carries no namespace
std::optional<std::string> attribute(const xmlNode* node, const std::string& name);

} // namespace epubdiff::xml
