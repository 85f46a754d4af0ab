#include "epubdiff/content_diff.hpp"
#include "epubdiff/archive.hpp"
#include "epubdiff/digest.hpp"
#include "epubdiff/structural_diff.hpp"
#include "epubdiff/text.hpp"

#include <algorithm>
#include <iterator>

#include <spdlog/spdlog.h>

namespace epubdiff {

namespace {

std::string digest_prefix(const std::vector<uint8_t>& data, const std::string& path) {
    auto digest = sha1_hex(data, DIGEST_PREFIX_LENGTH);
    if (!digest.ok) {
        spdlog::warn("Digest failed for {}: {}", path, digest.error);
        return {};
    }
    return digest.hex_digest;
}

} // namespace

std::string ChangeRecord::describe() const {
    return path + "  (" + std::to_string(original_size) + " -> " +
           std::to_string(translated_size) + " bytes)  " +
           original_digest + " -> " + translated_digest;
}

bool is_markup_path(const std::string& path, const std::vector<std::string>& extensions) {
    if (path == MIMETYPE_PATH) {
        return false;
    }
    std::string lower = to_lower(path);
    for (const auto& ext : extensions) {
        if (ends_with(lower, to_lower(ext))) {
            return true;
        }
    }
    return false;
}

std::vector<std::string> common_paths(const std::set<std::string>& original,
                                      const std::set<std::string>& translated) {
    std::vector<std::string> result;
    std::set_intersection(original.begin(), original.end(),
                          translated.begin(), translated.end(),
                          std::back_inserter(result));
    return result;
}

ContentDiff diff_contents(const ZipArchive& original, const ZipArchive& translated,
                          const CompareOptions& options) {
    ContentDiff result;
    result.compared = common_paths(original.file_set(), translated.file_set());

    for (const auto& path : result.compared) {
        auto orig_read = original.read(path);
        auto tran_read = translated.read(path);

        if (!orig_read.ok || !tran_read.ok) {
            std::string error = !orig_read.ok ? "orig: " + orig_read.error
                                              : "tran: " + tran_read.error;
            result.unreadable.push_back({path, error});
            continue;
        }

        if (orig_read.data == tran_read.data) {
            continue;
        }

        ChangeRecord record;
        record.path = path;
        record.original_size = orig_read.data.size();
        record.translated_size = tran_read.data.size();
        record.original_digest = digest_prefix(orig_read.data, path);
        record.translated_digest = digest_prefix(tran_read.data, path);
        record.markup = is_markup_path(path, options.markup_extensions);

        if (record.markup) {
            if (result.markup_changes.size() < options.max_validated_markup) {
                result.translated_markup[path] = std::move(tran_read.data);
            }
            result.markup_changes.push_back(path);
        } else {
            result.non_markup_changes.push_back(path);
        }
        result.changes.push_back(std::move(record));
    }

    spdlog::debug("Compared {} common files: {} changed ({} markup), {} unreadable",
                  result.compared.size(), result.changes.size(),
                  result.markup_changes.size(), result.unreadable.size());
    return result;
}

} // namespace epubdiff
