#include "epubdiff/container.hpp"
#include "epubdiff/archive.hpp"
#include "epubdiff/path_utils.hpp"
#include "xml/xml_util.hpp"

#include <spdlog/spdlog.h>

namespace epubdiff {

std::optional<std::string> resolve_rootfile(const std::string& container_xml) {
    auto parsed = xml::parse(container_xml, CONTAINER_PATH);
    if (!parsed.ok) {
        spdlog::debug("container.xml not parsable: {}", parsed.error);
        return std::nullopt;
    }

    auto rootfiles = xml::find_descendants(xml::root_element(parsed), "rootfile");
    if (rootfiles.empty()) {
        return std::nullopt;
    }

    auto full_path = xml::attribute(rootfiles.front(), "full-path");
    if (!full_path || full_path->empty()) {
        full_path = xml::attribute(rootfiles.front(), "fullPath");
    }
    if (!full_path || full_path->empty()) {
        return std::nullopt;
    }

    std::string normalized = normalize_path(*full_path);
    if (normalized.empty()) {
        return std::nullopt;
    }
    return normalized;
}

std::optional<std::string> read_rootfile_path(const ZipArchive& archive,
                                              const std::string& encoding) {
    if (!archive.contains(CONTAINER_PATH)) {
        return std::nullopt;
    }
    auto text = archive.read_text(CONTAINER_PATH, encoding);
    if (!text) {
        return std::nullopt;
    }
    return resolve_rootfile(*text);
}

} // namespace epubdiff
