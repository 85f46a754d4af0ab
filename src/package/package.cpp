#include "epubdiff/package.hpp"
#include "epubdiff/archive.hpp"
#include "epubdiff/container.hpp"
#include "epubdiff/path_utils.hpp"
#include "xml/xml_util.hpp"

#include <unordered_map>

#include <spdlog/spdlog.h>

namespace epubdiff {

namespace {

// Collect <child> elements below any <parent> descendant of root, all in ns
std::vector<xmlNode*> select_items(xmlNode* root, const std::string& parent,
                                   const std::string& child, const std::string& ns) {
    std::vector<xmlNode*> items;
    for (xmlNode* container : xml::find_descendants_ns(root, parent, ns)) {
        for (xmlNode* item : xml::find_children_ns(container, child, ns)) {
            items.push_back(item);
        }
    }
    return items;
}

// Namespace-qualified lookup first, unqualified as a fallback
std::vector<xmlNode*> select_items_any(xmlNode* root, const std::string& parent,
                                       const std::string& child, const std::string& ns) {
    auto items = select_items(root, parent, child, ns);
    if (items.empty() && !ns.empty()) {
        items = select_items(root, parent, child, "");
    }
    return items;
}

} // namespace

std::string PackageDocument::media_type_of(const std::string& p) const {
    auto it = media_types.find(p);
    if (it == media_types.end()) {
        return {};
    }
    return it->second;
}

PackageDocument parse_package(const std::string& text, const std::string& package_path) {
    PackageDocument result;
    result.path = package_path;

    auto parsed = xml::parse(text, package_path.empty() ? "package.opf" : package_path);
    if (!parsed.ok) {
        result.error = "package document not parsable: " + parsed.error;
        return result;
    }

    xmlNode* root = xml::root_element(parsed);
    result.namespace_uri = xml::namespace_uri(root);

    std::string base_dir = normalize_path(get_parent_directory(package_path));

    std::unordered_map<std::string, std::string> id_to_path;

    for (xmlNode* item : select_items_any(root, "manifest", "item", result.namespace_uri)) {
        std::string href = xml::attribute(item, "href").value_or("");
        if (href.empty()) {
            continue;
        }

        ManifestEntry entry;
        entry.id = xml::attribute(item, "id").value_or("");
        entry.media_type = xml::attribute(item, "media-type").value_or("");
        entry.path = resolve_relative(base_dir, href);

        result.manifest_paths.push_back(entry.path);
        if (!entry.media_type.empty()) {
            result.media_types[entry.path] = entry.media_type;
        }
        if (!entry.id.empty()) {
            id_to_path[entry.id] = entry.path;
        }
        result.manifest.push_back(std::move(entry));
    }

    for (xmlNode* itemref : select_items_any(root, "spine", "itemref", result.namespace_uri)) {
        std::string idref = xml::attribute(itemref, "idref").value_or("");
        auto it = id_to_path.find(idref);
        if (it != id_to_path.end()) {
            result.spine.push_back(it->second);
        }
    }

    result.ok = true;
    return result;
}

PackageInfo load_package(const ZipArchive& archive, const std::string& encoding) {
    PackageInfo info;
    info.rootfile = read_rootfile_path(archive, encoding);
    if (!info.rootfile) {
        spdlog::debug("No rootfile resolved for {}", archive.path());
        return info;
    }

    if (!archive.contains(*info.rootfile)) {
        spdlog::debug("Rootfile {} not present in {}", *info.rootfile, archive.path());
        return info;
    }

    auto text = archive.read_text(*info.rootfile, encoding);
    if (!text) {
        // Unreadable package documents degrade to empty manifest/spine data
        PackageDocument empty;
        empty.path = *info.rootfile;
        empty.error = "package document not readable";
        info.document = std::move(empty);
        return info;
    }

    info.document = parse_package(*text, *info.rootfile);
    if (!info.document->ok) {
        spdlog::debug("{}: {}", archive.path(), info.document->error);
    } else {
        spdlog::debug("Parsed {} from {} ({} manifest items, {} spine items)",
                      *info.rootfile, archive.path(),
                      info.document->manifest_paths.size(), info.document->spine.size());
    }
    return info;
}

} // namespace epubdiff
