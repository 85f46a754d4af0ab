#include "epubdiff/report.hpp"

namespace epubdiff {

void ComparisonReport::begin_section(const std::string& title) {
    sections_.push_back({title, {}});
}

void ComparisonReport::add_line(const std::string& line) {
    if (sections_.empty()) {
        sections_.push_back({});
    }
    sections_.back().lines.push_back(line);
}

const ReportSection* ComparisonReport::find_section(const std::string& title) const {
    for (const auto& section : sections_) {
        if (section.title == title) {
            return &section;
        }
    }
    return nullptr;
}

std::string ComparisonReport::render() const {
    std::string out;
    bool first = true;
    auto append = [&](const std::string& line) {
        if (!first) out.push_back('\n');
        out += line;
        first = false;
    };

    for (const auto& section : sections_) {
        if (!section.title.empty()) {
            append("== " + section.title + " ==");
        }
        for (const auto& line : section.lines) {
            append(line);
        }
    }
    return out;
}

} // namespace epubdiff
