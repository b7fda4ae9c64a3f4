#pragma once

#include <array>
#include <chrono>
#include <string>
#include <vector>

#include "common/models.hpp"

namespace taskheader {

// Section order of a rendered document. Fixed so that regenerating the same
// issue list produces a stable diff.
constexpr std::array<StateCategory, 5> kSectionOrder = {
    StateCategory::Backlog,
    StateCategory::Unstarted,
    StateCategory::Started,
    StateCategory::Completed,
    StateCategory::Canceled,
};

// Bucket an issue renders into. Issues with no state or an unknown category
// fall back to Unstarted.
StateCategory sectionFor(const Issue &issue);

/**
 * Render issues as a checkbox document:
 *
 *   # {title}
 *
 *   *Generated: YYYY-MM-DD HH:MM:SS*
 *
 *   {description}            (omitted when empty, with its blank line)
 *
 *   ---
 *
 *   ## Started
 *
 *   - [ ] **ENG-1**: Title *[In Progress]* <!-- id:abc -->
 *
 * The trailing id comment is the only part MarkdownParser trusts; everything
 * else on the line is display text.
 */
std::string renderIssuesMarkdown(const std::string &title,
                                 const std::vector<Issue> &issues,
                                 const std::string &description,
                                 std::chrono::system_clock::time_point generatedAt
                                 = std::chrono::system_clock::now());

std::string renderIssueLine(const Issue &issue, StateCategory section);

// Lowercase, then replace everything outside [A-Za-z0-9_-] with '_'.
std::string sanitizeFileComponent(const std::string &name);

} // namespace taskheader
