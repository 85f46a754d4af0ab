#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace epubdiff {

// ============================================================================
// Finding Kinds
// ============================================================================

enum class FindingKind {
    missing_file,                   // In original, not in translated
    extra_file,                     // In translated, not in original
    mimetype_missing,
    mimetype_invalid_content,
    mimetype_not_first,
    mimetype_compressed,
    rootfile_mismatch,
    manifest_missing,
    manifest_extra,
    media_type_mismatch,
    reading_order_mismatch,
    manifest_reference_missing,
    content_changed,
    content_unreadable,
    markup_issue,
    markup_malformed,
};

// Convert finding kind to canonical lowercase snake_case string
inline const char* finding_to_string(FindingKind kind) {
    switch (kind) {
        case FindingKind::missing_file: return "missing_file";
        case FindingKind::extra_file: return "extra_file";
        case FindingKind::mimetype_missing: return "mimetype_missing";
        case FindingKind::mimetype_invalid_content: return "mimetype_invalid_content";
        case FindingKind::mimetype_not_first: return "mimetype_not_first";
        case FindingKind::mimetype_compressed: return "mimetype_compressed";
        case FindingKind::rootfile_mismatch: return "rootfile_mismatch";
        case FindingKind::manifest_missing: return "manifest_missing";
        case FindingKind::manifest_extra: return "manifest_extra";
        case FindingKind::media_type_mismatch: return "media_type_mismatch";
        case FindingKind::reading_order_mismatch: return "reading_order_mismatch";
        case FindingKind::manifest_reference_missing: return "manifest_reference_missing";
        case FindingKind::content_changed: return "content_changed";
        case FindingKind::content_unreadable: return "content_unreadable";
        case FindingKind::markup_issue: return "markup_issue";
        case FindingKind::markup_malformed: return "markup_malformed";
        default: return "unknown";
    }
}

// Parse finding key string to enum (case-insensitive)
std::optional<FindingKind> parse_finding_key(const std::string& key);

// ============================================================================
// Finding Action
// ============================================================================

enum class FindingAction {
    Warn,
    Ignore,
    Error
};

inline const char* action_to_string(FindingAction a) {
    switch (a) {
        case FindingAction::Warn: return "warn";
        case FindingAction::Ignore: return "ignore";
        case FindingAction::Error: return "error";
        default: return "warn";
    }
}

std::optional<FindingAction> parse_finding_action(const std::string& s);

using FindingPolicy = std::unordered_map<std::string, FindingAction>;

// ============================================================================
// Findings
// ============================================================================

struct Finding {
    FindingKind kind;
    std::string side;       // "orig", "tran" or empty when it concerns both
    std::string subject;    // Path or short description
    FindingAction action = FindingAction::Warn;
};

class FindingCollector {
public:
    FindingCollector() = default;

    explicit FindingCollector(FindingPolicy policy)
        : policy_(std::move(policy)) {}

    void emit(FindingKind kind, const std::string& subject, const std::string& side = "");

    // Findings after policy application; ignored findings are excluded
    std::vector<Finding> get_findings() const;

    bool has_errors() const;

private:
    FindingPolicy policy_;
    std::vector<Finding> findings_;

    FindingAction get_effective_action(FindingKind kind) const;
};

} // namespace epubdiff
