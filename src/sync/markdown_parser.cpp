#include "sync/markdown_parser.hpp"

#include <algorithm>
#include <regex>

#include <QFile>

#include <nlohmann/json.hpp>

#include "common/logging.hpp"

namespace taskheader {

namespace {

const std::regex &checkboxPattern()
{
    static const std::regex pattern(R"(- \[([ x])\])");
    return pattern;
}

const std::regex &idCommentPattern()
{
    static const std::regex pattern(R"(<!-- id:(\S+) -->)");
    return pattern;
}

} // namespace

std::vector<SyncIntent> parseMarkdown(const std::string &text)
{
    struct Marker {
        size_t begin;
        size_t end;
        bool checked;
    };

    std::vector<Marker> markers;
    for (auto it = std::sregex_iterator(text.begin(), text.end(), checkboxPattern());
         it != std::sregex_iterator(); ++it) {
        const std::smatch &match = *it;
        const size_t begin = static_cast<size_t>(match.position(0));
        markers.push_back(Marker{begin,
                                 begin + static_cast<size_t>(match.length(0)),
                                 match.str(1) == "x"});
    }

    std::vector<SyncIntent> intents;
    intents.reserve(markers.size());

    for (size_t i = 0; i < markers.size(); ++i) {
        const Marker &marker = markers[i];

        size_t spanEnd = text.find('\n', marker.end);
        if (spanEnd == std::string::npos) {
            spanEnd = text.size();
        }
        if (i + 1 < markers.size()) {
            spanEnd = std::min(spanEnd, markers[i + 1].begin);
        }

        std::smatch idMatch;
        const auto spanBegin = text.begin() + static_cast<std::ptrdiff_t>(marker.end);
        const auto spanStop = text.begin() + static_cast<std::ptrdiff_t>(spanEnd);
        if (!std::regex_search(spanBegin, spanStop, idMatch, idCommentPattern())) {
            continue;
        }

        intents.push_back(SyncIntent{idMatch.str(1), marker.checked});
    }

    return intents;
}

std::vector<SyncIntent> parseMarkdownFile(const std::string &path)
{
    QFile file(QString::fromStdString(path));
    if (!file.open(QIODevice::ReadOnly)) {
        THLOG_DEBUG(QStringLiteral("MarkdownParser"),
                    QStringLiteral("parseMarkdownFile"),
                    QStringLiteral("markdown_unreadable"),
                    QStringLiteral("file_missing_or_locked"),
                    QStringLiteral("empty_result"),
                    logging::defaultWho(),
                    QString(),
                    nlohmann::json{{"path", path},
                                   {"error", file.errorString().toStdString()}});
        return {};
    }

    return parseMarkdown(file.readAll().toStdString());
}

} // namespace taskheader
