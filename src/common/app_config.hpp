#pragma once

#include <optional>
#include <string>

namespace taskheader {

// Typed view of the persisted settings. Field defaults are the values used
// when the file or a key is missing.
struct AppConfig {
    std::string linearApiKey;
    std::string hotkey = "ctrl+w";

    int headerWidthPercent = 10;
    int headerHeightPercent = 10;
    std::string headerPosition = "top-middle";
    int transparencyPercent = 0;
    int fontSize = 40;

    std::optional<std::string> currentIssueId;

    bool markdownAutoGenerate = true;
    bool syncOnEdit = true;
    std::string markdownOutputDir = ".";
    int issueFetchLimit = 50;
};

// $HOME/.taskheader_config.json
std::string defaultConfigPath();

// A missing file is not an error: cfg keeps its defaults and true is returned.
// Unreadable or malformed files reset cfg to defaults and return false.
bool loadConfig(const std::string &path, AppConfig &cfg, std::string *err = nullptr);
bool saveConfig(const std::string &path, const AppConfig &cfg, std::string *err = nullptr);

} // namespace taskheader
