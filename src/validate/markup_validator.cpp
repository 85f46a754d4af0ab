#include "epubdiff/markup_validator.hpp"
#include "epubdiff/archive.hpp"
#include "epubdiff/content_diff.hpp"
#include "epubdiff/package.hpp"
#include "epubdiff/path_utils.hpp"
#include "epubdiff/text.hpp"
#include "xml/xml_util.hpp"

#include <cctype>

#include <spdlog/spdlog.h>

namespace epubdiff {

namespace {

const char* const VOID_ELEMENTS[] = {"img", "br", "hr"};

bool is_word_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

bool is_digit(char c) {
    return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

bool is_alpha(char c) {
    return std::isalpha(static_cast<unsigned char>(c)) != 0;
}

bool is_alnum(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) != 0;
}

bool is_hex(char c) {
    return std::isxdigit(static_cast<unsigned char>(c)) != 0;
}

// &#123; &#x1F; or &name; (name: letter followed by at least one alphanumeric)
bool is_character_reference(const std::string& text, size_t amp) {
    const size_t n = text.size();
    size_t i = amp + 1;

    if (i < n && text[i] == '#') {
        ++i;
        if (i < n && text[i] == 'x') {
            size_t start = ++i;
            while (i < n && is_hex(text[i])) ++i;
            return i > start && i < n && text[i] == ';';
        }
        size_t start = i;
        while (i < n && is_digit(text[i])) ++i;
        return i > start && i < n && text[i] == ';';
    }

    if (i < n && is_alpha(text[i])) {
        size_t start = i++;
        while (i < n && is_alnum(text[i])) ++i;
        return i - start >= 2 && i < n && text[i] == ';';
    }

    return false;
}

// scheme: prefix of an absolute URI
bool has_uri_scheme(const std::string& ref) {
    if (ref.empty() || !is_alpha(ref[0])) {
        return false;
    }
    for (size_t i = 1; i < ref.size(); ++i) {
        char c = ref[i];
        if (c == ':') return true;
        if (!is_alnum(c) && c != '+' && c != '.' && c != '-') return false;
    }
    return false;
}

std::string strip_fragment_and_query(const std::string& ref) {
    auto pos = ref.find_first_of("#?");
    if (pos == std::string::npos) {
        return ref;
    }
    return ref.substr(0, pos);
}

} // namespace

bool is_strict_markup(const std::string& path, const std::vector<std::string>& strict_extensions) {
    std::string lower = to_lower(path);
    for (const auto& ext : strict_extensions) {
        if (ends_with(lower, to_lower(ext))) {
            return true;
        }
    }
    return false;
}

bool has_unescaped_ampersand(const std::string& text) {
    for (size_t pos = text.find('&'); pos != std::string::npos; pos = text.find('&', pos + 1)) {
        if (!is_character_reference(text, pos)) {
            return true;
        }
    }
    return false;
}

bool has_unclosed_void_element(const std::string& text, const std::string& tag) {
    std::string lower = to_lower(text);
    std::string open = "<" + to_lower(tag);

    size_t pos = 0;
    while ((pos = lower.find(open, pos)) != std::string::npos) {
        size_t after = pos + open.size();
        if (after < lower.size() && is_word_char(lower[after])) {
            // <image>, <brx> ...
            pos = after;
            continue;
        }
        size_t close = lower.find('>', after);
        if (close == std::string::npos) {
            return false;
        }
        if (lower[close - 1] != '/') {
            return true;
        }
        pos = close + 1;
    }
    return false;
}

std::vector<std::string> extract_resource_references(const std::string& text) {
    std::vector<std::string> refs;
    std::string lower = to_lower(text);
    const size_t n = text.size();

    size_t i = 0;
    while (i < n) {
        size_t quote_pos;
        if (lower.compare(i, 4, "src=") == 0) {
            quote_pos = i + 4;
        } else if (lower.compare(i, 5, "href=") == 0) {
            quote_pos = i + 5;
        } else {
            ++i;
            continue;
        }

        if (quote_pos >= n || (text[quote_pos] != '"' && text[quote_pos] != '\'')) {
            ++i;
            continue;
        }

        // The value runs to the next quote of either kind
        size_t end = quote_pos + 1;
        while (end < n && text[end] != '"' && text[end] != '\'') ++end;
        if (end >= n || end == quote_pos + 1) {
            ++i;
            continue;
        }

        refs.push_back(text.substr(quote_pos + 1, end - quote_pos - 1));
        i = end + 1;
    }
    return refs;
}

std::vector<std::string> validate_markup(const std::string& path,
                                         const std::string& text,
                                         bool strict,
                                         const std::set<std::string>& file_set) {
    std::vector<std::string> issues;
    std::string lower = to_lower(text);

    // Namespace on the root element, approximated by the text before the first '>'
    if (strict && lower.find("<html") != std::string::npos) {
        std::string head = lower.substr(0, lower.find('>'));
        if (head.find("xmlns=") == std::string::npos) {
            issues.push_back("missing xmlns on <html>");
        }
    }

    if (has_unescaped_ampersand(text)) {
        issues.push_back("unescaped & found");
    }

    if (strict) {
        for (const char* tag : VOID_ELEMENTS) {
            if (has_unclosed_void_element(text, tag)) {
                issues.push_back(std::string("xhtml <") + tag + "> not self-closed");
            }
        }
    }

    std::string base_dir = normalize_path(get_parent_directory(path));
    for (const auto& raw : extract_resource_references(text)) {
        std::string href = trim(raw);
        if (href.empty() || href[0] == '#' || has_uri_scheme(href)) {
            continue;
        }
        std::string target = strip_fragment_and_query(href);
        if (target.empty()) {
            continue;
        }
        std::string full = resolve_relative(base_dir, target);
        if (file_set.count(full) == 0) {
            issues.push_back("missing referenced resource: " + full);
        }
    }

    if (starts_with(to_lower(get_filename(path)), "toc")) {
        bool has_nav = lower.find("nav") != std::string::npos;
        bool has_toc_role = lower.find("epub:type=\"toc\"") != std::string::npos ||
                            lower.find("role=\"doc-toc\"") != std::string::npos;
        if (!has_nav || !has_toc_role) {
            issues.push_back("toc.xhtml: missing <nav epub:type=\"toc\"> or role=\"doc-toc\"");
        }
    }

    return issues;
}

std::vector<MarkupFinding> validate_changed_markup(const ContentDiff& diff,
                                                   const std::set<std::string>& translated_files,
                                                   const CompareOptions& options) {
    std::vector<MarkupFinding> findings;

    size_t validated = 0;
    for (const auto& path : diff.markup_changes) {
        if (validated >= options.max_validated_markup) break;
        auto it = diff.translated_markup.find(path);
        if (it == diff.translated_markup.end()) continue;
        ++validated;

        std::string text = decode_text(it->second, options.text_encoding);
        bool strict = is_strict_markup(path, options.strict_extensions);
        for (auto& issue : validate_markup(path, text, strict, translated_files)) {
            if (findings.size() >= options.max_markup_findings) {
                return findings;
            }
            findings.push_back({path, std::move(issue)});
        }
    }
    return findings;
}

// ============================================================================
// Well-formedness
// ============================================================================

WellFormedResult check_well_formed(const std::string& text) {
    WellFormedResult result;
    auto parsed = xml::parse(text, "document.xhtml");
    if (!parsed.ok) {
        result.error = parsed.error;
        return result;
    }

    // With an external DOCTYPE libxml2 only reports undefined entities
    // (&nbsp; in XHTML 1.1) without failing the parse; readers that do not
    // load the DTD reject them
    for (const auto& diagnostic : parsed.diagnostics) {
        if (diagnostic.code == XML_WAR_UNDECLARED_ENTITY ||
            diagnostic.code == XML_ERR_UNDECLARED_ENTITY) {
            result.error = "line " + std::to_string(diagnostic.line) + ": " + diagnostic.message;
            return result;
        }
    }
    result.ok = true;
    return result;
}

std::vector<MalformedDocument> find_malformed_documents(const ZipArchive& translated,
                                                        const PackageDocument& original_package,
                                                        const PackageDocument& translated_package,
                                                        const CompareOptions& options) {
    std::set<std::string> orig_paths(original_package.manifest_paths.begin(),
                                     original_package.manifest_paths.end());
    std::set<std::string> tran_paths(translated_package.manifest_paths.begin(),
                                     translated_package.manifest_paths.end());

    std::vector<MalformedDocument> malformed;
    size_t checked = 0;
    for (const auto& path : orig_paths) {
        if (checked >= options.max_wellformed_checked) break;
        if (tran_paths.count(path) == 0) continue;
        if (original_package.media_type_of(path) != XHTML_MEDIA_TYPE) continue;
        ++checked;

        auto read_result = translated.read(path);
        if (!read_result.ok) {
            malformed.push_back({path, read_result.error});
            continue;
        }

        auto result = check_well_formed(decode_text(read_result.data, options.text_encoding));
        if (!result.ok) {
            malformed.push_back({path, result.error});
        }
    }

    spdlog::debug("Checked {} translated XHTML documents, {} not well-formed",
                  checked, malformed.size());
    return malformed;
}

} // namespace epubdiff
