#include "epubdiff/options.hpp"
#include "epubdiff/text.hpp"

#include <optional>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace epubdiff {

namespace {

// Helper to safely get a string from JSON
std::optional<std::string> get_string(const nlohmann::json& j, const std::string& key) {
    if (j.contains(key) && j[key].is_string()) {
        return j[key].get<std::string>();
    }
    return std::nullopt;
}

// Helper to safely get a string array from JSON
std::vector<std::string> get_string_array(const nlohmann::json& j, const std::string& key) {
    std::vector<std::string> result;
    if (j.contains(key) && j[key].is_array()) {
        for (const auto& elem : j[key]) {
            if (elem.is_string()) {
                result.push_back(elem.get<std::string>());
            }
        }
    }
    return result;
}

void read_limit(const nlohmann::json& limits, const std::string& key, size_t& target,
                std::vector<std::string>& warnings) {
    if (!limits.contains(key)) {
        return;
    }
    const auto& value = limits[key];
    if (value.is_number_unsigned() || (value.is_number_integer() && value.get<long long>() >= 0)) {
        target = value.get<size_t>();
    } else {
        warnings.push_back("invalid_configuration:invalid_limit:" + key);
    }
}

std::vector<std::string> normalize_extensions(const std::vector<std::string>& exts) {
    std::vector<std::string> result;
    for (const auto& ext : exts) {
        std::string lower = to_lower(trim(ext));
        if (lower.empty()) continue;
        if (lower[0] != '.') lower.insert(lower.begin(), '.');
        result.push_back(lower);
    }
    return result;
}

bool is_known_log_level(const std::string& level) {
    return level == "trace" || level == "debug" || level == "info" ||
           level == "warn" || level == "warning" || level == "error" || level == "off";
}

} // namespace

CompareOptions get_default_options() {
    return CompareOptions{};
}

OptionsParseResult parse_compare_options(const std::string& json_str,
                                         const std::string& source_path) {
    OptionsParseResult result;
    result.options.source_path = source_path;

    try {
        auto j = nlohmann::json::parse(json_str);

        if (!j.is_object()) {
            result.error = "JSON must be an object";
            return result;
        }

        // "limits" section
        if (j.contains("limits")) {
            if (j["limits"].is_object()) {
                const auto& limits = j["limits"];
                auto& o = result.options;
                read_limit(limits, "listed_paths", o.max_listed_paths, result.warnings);
                read_limit(limits, "listed_changes", o.max_listed_changes, result.warnings);
                read_limit(limits, "validated_markup", o.max_validated_markup, result.warnings);
                read_limit(limits, "markup_findings", o.max_markup_findings, result.warnings);
                read_limit(limits, "wellformed_checked", o.max_wellformed_checked, result.warnings);
                read_limit(limits, "wellformed_listed", o.max_wellformed_listed, result.warnings);
                read_limit(limits, "summary_samples", o.max_summary_samples, result.warnings);
            } else {
                result.warnings.push_back("invalid_configuration:limits_not_object");
            }
        }

        if (auto mimetype = get_string(j, "expected_mimetype")) {
            result.options.expected_mimetype = trim(*mimetype);
        }

        if (j.contains("markup_extensions")) {
            auto exts = normalize_extensions(get_string_array(j, "markup_extensions"));
            if (exts.empty()) {
                result.warnings.push_back("invalid_configuration:empty_markup_extensions");
            } else {
                result.options.markup_extensions = exts;
            }
        }

        if (j.contains("strict_extensions")) {
            result.options.strict_extensions =
                normalize_extensions(get_string_array(j, "strict_extensions"));
        }

        if (auto encoding = get_string(j, "text_encoding")) {
            if (is_known_encoding(*encoding)) {
                result.options.text_encoding = to_lower(trim(*encoding));
            } else {
                result.warnings.push_back("invalid_configuration:unknown_encoding:" + *encoding);
            }
        }

        if (auto level = get_string(j, "log_level")) {
            std::string lower = to_lower(trim(*level));
            if (!is_known_log_level(lower)) {
                result.warnings.push_back("invalid_configuration:invalid_log_level");
            } else {
                result.options.log_level = lower;
            }
        }

        // "findings" section
        if (j.contains("findings") && j["findings"].is_object()) {
            for (auto& [key, val] : j["findings"].items()) {
                std::string key_str = to_lower(key);
                if (!parse_finding_key(key_str)) {
                    result.warnings.push_back("invalid_configuration:unknown_finding:" + key_str);
                    continue;
                }
                if (!val.is_string()) {
                    result.warnings.push_back("invalid_configuration:invalid_finding_action:" + key_str);
                    continue;
                }
                auto action = parse_finding_action(val.get<std::string>());
                if (action) {
                    result.options.finding_policy[key_str] = *action;
                } else {
                    result.warnings.push_back("invalid_configuration:invalid_finding_action:" + key_str);
                }
            }
        }

        result.ok = true;
        return result;

    } catch (const nlohmann::json::parse_error& e) {
        result.error = std::string("parse error: ") + e.what();
        return result;
    } catch (const nlohmann::json::exception& e) {
        result.error = std::string("JSON error: ") + e.what();
        return result;
    }
}

void apply_log_level(const CompareOptions& options) {
    std::string level = to_lower(trim(options.log_level));
    if (level == "trace") {
        spdlog::set_level(spdlog::level::trace);
    } else if (level == "debug") {
        spdlog::set_level(spdlog::level::debug);
    } else if (level == "warn" || level == "warning") {
        spdlog::set_level(spdlog::level::warn);
    } else if (level == "error") {
        spdlog::set_level(spdlog::level::err);
    } else if (level == "off") {
        spdlog::set_level(spdlog::level::off);
    } else {
        spdlog::set_level(spdlog::level::info);
    }
}

} // namespace epubdiff
