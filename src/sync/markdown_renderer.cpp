#include "sync/markdown_renderer.hpp"

#include <ctime>
#include <iomanip>
#include <map>
#include <sstream>

#include <QString>

#include "common/json_utils.hpp"

namespace taskheader {

namespace {

std::string formatGeneratedAt(std::chrono::system_clock::time_point timestamp)
{
    std::time_t time = std::chrono::system_clock::to_time_t(timestamp);
    std::tm tm{};
#if defined(_WIN32)
    localtime_s(&tm, &time);
#else
    localtime_r(&time, &tm);
#endif
    std::ostringstream out;
    out << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
    return out.str();
}

std::string sectionHeading(StateCategory category)
{
    std::string name = toCategoryString(category);
    name[0] = static_cast<char>(name[0] - 'a' + 'A');
    return "## " + name;
}

const std::string &orDefault(const std::string &value, const std::string &fallback)
{
    return value.empty() ? fallback : value;
}

} // namespace

StateCategory sectionFor(const Issue &issue)
{
    if (issue.state.has_value() && issue.state->type.has_value()) {
        return *issue.state->type;
    }
    return StateCategory::Unstarted;
}

std::string renderIssueLine(const Issue &issue, StateCategory section)
{
    static const std::string kNoIdentifier = "N/A";
    static const std::string kNoTitle = "No title";
    static const std::string kNoStateName = "Unknown";

    const bool checked = section == StateCategory::Completed
        || section == StateCategory::Canceled;
    const std::string stateName = issue.state.has_value() ? issue.state->name : std::string();

    std::string line = checked ? "- [x] " : "- [ ] ";
    line += "**" + orDefault(issue.identifier, kNoIdentifier) + "**: ";
    line += orDefault(issue.title, kNoTitle);
    line += " *[" + orDefault(stateName, kNoStateName) + "]*";
    line += " <!-- id:" + issue.id + " -->";
    return line;
}

std::string renderIssuesMarkdown(const std::string &title,
                                 const std::vector<Issue> &issues,
                                 const std::string &description,
                                 std::chrono::system_clock::time_point generatedAt)
{
    std::vector<std::string> lines = {
        "# " + title,
        "",
        "*Generated: " + formatGeneratedAt(generatedAt) + "*",
        "",
    };

    if (!description.empty()) {
        lines.push_back(description);
        lines.push_back("");
    }

    lines.push_back("---");
    lines.push_back("");

    // Input order is kept within a section.
    std::map<StateCategory, std::vector<const Issue *>> sections;
    for (const auto &issue : issues) {
        sections[sectionFor(issue)].push_back(&issue);
    }

    for (StateCategory category : kSectionOrder) {
        auto it = sections.find(category);
        if (it == sections.end() || it->second.empty()) {
            continue;
        }

        lines.push_back(sectionHeading(category));
        lines.push_back("");
        for (const Issue *issue : it->second) {
            lines.push_back(renderIssueLine(*issue, category));
        }
        lines.push_back("");
    }

    std::string text;
    for (size_t i = 0; i < lines.size(); ++i) {
        if (i > 0) {
            text += '\n';
        }
        text += lines[i];
    }
    return text;
}

std::string sanitizeFileComponent(const std::string &name)
{
    // One '_' per code point, so "Équipe" becomes "_quipe" and an emoji
    // outside the BMP still counts as a single character.
    const QList<uint> codePoints = QString::fromStdString(name).toLower().toUcs4();
    QString safe;
    safe.reserve(codePoints.size());
    for (const uint c : codePoints) {
        const bool allowed = (c >= 'a' && c <= 'z')
            || (c >= 'A' && c <= 'Z')
            || (c >= '0' && c <= '9')
            || c == '_' || c == '-';
        safe.append(allowed ? QChar(static_cast<char16_t>(c)) : QChar(u'_'));
    }
    return safe.toStdString();
}

} // namespace taskheader
