#pragma once

#include <string>
#include <vector>

namespace epubdiff {

// ============================================================================
// Comparison Report
// ============================================================================

struct ReportSection {
    std::string title;              // Empty for the untitled header section
    std::vector<std::string> lines;
};

// Ordered, append-only list of sections. Lines always go to the most
// recently opened section.
class ComparisonReport {
public:
    // Start a new section; an empty title renders without a banner
    void begin_section(const std::string& title);

    // Append to the current section (opens an untitled one if needed)
    void add_line(const std::string& line);

    const std::vector<ReportSection>& sections() const { return sections_; }

    // Find a section by title, nullptr if absent
    const ReportSection* find_section(const std::string& title) const;

    // Plain text: "== TITLE ==" banner per titled section, one line each,
    // joined with '\n'
    std::string render() const;

private:
    std::vector<ReportSection> sections_;
};

} // namespace epubdiff
