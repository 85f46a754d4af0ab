#include "epubdiff/path_utils.hpp"
#include "epubdiff/text.hpp"

#include <sstream>
#include <string>
#include <vector>

namespace epubdiff {

namespace {

std::vector<std::string> split(const std::string& s, char delim) {
    std::vector<std::string> parts;
    std::string current;
    std::istringstream ss(s);
    while (std::getline(ss, current, delim)) {
        parts.push_back(current);
    }
    return parts;
}

} // namespace

std::string to_portable_path(const std::string& path) {
    std::string result = path;
    for (char& c : result) {
        if (c == '\\') c = '/';
    }
    return result;
}

std::string normalize_path(const std::string& path) {
    std::string portable = trim(to_portable_path(path));
    if (portable.empty()) {
        return {};
    }

    bool absolute = portable[0] == '/';

    std::vector<std::string> normalized;
    for (const auto& part : split(portable, '/')) {
        if (part.empty() || part == ".") {
            continue;
        }
        if (part == "..") {
            if (!normalized.empty() && normalized.back() != "..") {
                normalized.pop_back();
                continue;
            }
            // "/.." is still "/"
            if (absolute) {
                continue;
            }
        }
        normalized.push_back(part);
    }

    std::string out = absolute ? "/" : "";
    for (size_t i = 0; i < normalized.size(); ++i) {
        if (i > 0) out.push_back('/');
        out += normalized[i];
    }
    return out;
}

std::string get_parent_directory(const std::string& path) {
    auto pos = path.find_last_of('/');
    if (pos == std::string::npos) {
        return {};
    }
    if (pos == 0) {
        return "/";
    }
    return path.substr(0, pos);
}

std::string get_filename(const std::string& path) {
    auto pos = path.find_last_of('/');
    if (pos == std::string::npos) {
        return path;
    }
    return path.substr(pos + 1);
}

std::string join_path(const std::string& base, const std::string& rel) {
    if (rel.empty()) return base;
    if (rel[0] == '/' || rel[0] == '\\') return rel;
    if (base.empty()) return rel;
    if (base.back() == '/') return base + rel;
    return base + "/" + rel;
}

std::string resolve_relative(const std::string& base_dir, const std::string& rel) {
    return normalize_path(join_path(base_dir, rel));
}

} // namespace epubdiff
