#pragma once

#include <string>
#include <vector>

#include "common/models.hpp"

namespace taskheader {

/**
 * Extract checkbox intents from a rendered document.
 *
 * A record is produced for every "- [ ]" or "- [x]" marker that is followed,
 * on the same line and before the next marker, by "<!-- id:TOKEN -->" where
 * TOKEN is a run of non-whitespace characters. Records are returned in
 * document order. Markers without an id comment are skipped: an item whose id
 * was edited away cannot be tracked.
 */
std::vector<SyncIntent> parseMarkdown(const std::string &text);

// Missing or unreadable files yield no intents.
std::vector<SyncIntent> parseMarkdownFile(const std::string &path);

} // namespace taskheader
