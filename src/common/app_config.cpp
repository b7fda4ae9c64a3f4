#include "common/app_config.hpp"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QSaveFile>

#include <nlohmann/json.hpp>

#include "common/logging.hpp"

namespace taskheader {

namespace {

int clampPercent(int value)
{
    if (value < 0) {
        return 0;
    }
    if (value > 100) {
        return 100;
    }
    return value;
}

const nlohmann::json &section(const nlohmann::json &root, const char *key)
{
    static const nlohmann::json kEmpty = nlohmann::json::object();
    auto it = root.find(key);
    if (it == root.end() || !it->is_object()) {
        return kEmpty;
    }
    return *it;
}

template <typename T>
T valueOr(const nlohmann::json &obj, const char *key, const T &fallback)
{
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) {
        return fallback;
    }
    try {
        return it->get<T>();
    } catch (const nlohmann::json::type_error &) {
        return fallback;
    }
}

void applyJson(const nlohmann::json &root, AppConfig &cfg)
{
    const AppConfig defaults;

    cfg.linearApiKey = valueOr<std::string>(root, "linear_api_key", defaults.linearApiKey);
    cfg.hotkey = valueOr<std::string>(root, "hotkey", defaults.hotkey);
    cfg.fontSize = valueOr<int>(root, "font_size", defaults.fontSize);

    auto it = root.find("current_issue_id");
    if (it != root.end() && it->is_string() && !it->get<std::string>().empty()) {
        cfg.currentIssueId = it->get<std::string>();
    } else {
        cfg.currentIssueId.reset();
    }

    const nlohmann::json &window = section(root, "window");
    cfg.headerWidthPercent =
        clampPercent(valueOr<int>(window, "width_percent", defaults.headerWidthPercent));
    cfg.headerHeightPercent =
        clampPercent(valueOr<int>(window, "height_percent", defaults.headerHeightPercent));
    cfg.headerPosition = valueOr<std::string>(window, "position", defaults.headerPosition);
    cfg.transparencyPercent =
        clampPercent(valueOr<int>(window, "transparency_percent", defaults.transparencyPercent));

    const nlohmann::json &markdown = section(root, "markdown");
    cfg.markdownAutoGenerate =
        valueOr<bool>(markdown, "auto_generate", defaults.markdownAutoGenerate);
    cfg.syncOnEdit = valueOr<bool>(markdown, "sync_on_edit", defaults.syncOnEdit);
    cfg.markdownOutputDir =
        valueOr<std::string>(markdown, "output_dir", defaults.markdownOutputDir);
    cfg.issueFetchLimit = valueOr<int>(markdown, "fetch_limit", defaults.issueFetchLimit);
    if (cfg.issueFetchLimit <= 0) {
        cfg.issueFetchLimit = defaults.issueFetchLimit;
    }
}

nlohmann::json toJson(const AppConfig &cfg)
{
    nlohmann::json root = {
        {"linear_api_key", cfg.linearApiKey},
        {"hotkey", cfg.hotkey},
        {"window", {
            {"width_percent", cfg.headerWidthPercent},
            {"height_percent", cfg.headerHeightPercent},
            {"position", cfg.headerPosition},
            {"transparency_percent", cfg.transparencyPercent}
        }},
        {"font_size", cfg.fontSize},
        {"markdown", {
            {"auto_generate", cfg.markdownAutoGenerate},
            {"sync_on_edit", cfg.syncOnEdit},
            {"output_dir", cfg.markdownOutputDir},
            {"fetch_limit", cfg.issueFetchLimit}
        }}
    };
    if (cfg.currentIssueId.has_value()) {
        root["current_issue_id"] = *cfg.currentIssueId;
    } else {
        root["current_issue_id"] = nullptr;
    }
    return root;
}

} // namespace

std::string defaultConfigPath()
{
    const QString home = qEnvironmentVariable("HOME");
    const QString base = home.isEmpty() ? QDir::currentPath() : home;
    return (base + QStringLiteral("/.taskheader_config.json")).toStdString();
}

bool loadConfig(const std::string &path, AppConfig &cfg, std::string *err)
{
    const QString qpath = QString::fromStdString(path);
    if (!QFileInfo::exists(qpath)) {
        return true;
    }

    QFile file(qpath);
    if (!file.open(QIODevice::ReadOnly)) {
        cfg = AppConfig{};
        if (err) {
            *err = "cannot open " + path + ": " + file.errorString().toStdString();
        }
        return false;
    }

    nlohmann::json root;
    try {
        root = nlohmann::json::parse(file.readAll().toStdString());
    } catch (const nlohmann::json::parse_error &ex) {
        cfg = AppConfig{};
        if (err) {
            *err = std::string("malformed config: ") + ex.what();
        }
        THLOG_WARN(QStringLiteral("AppConfig"),
                   QStringLiteral("loadConfig"),
                   QStringLiteral("config_parse_failed"),
                   QStringLiteral("malformed_json"),
                   QStringLiteral("defaults_applied"),
                   logging::defaultWho(),
                   QString(),
                   nlohmann::json{{"path", path}, {"error", ex.what()}});
        return false;
    }

    if (!root.is_object()) {
        cfg = AppConfig{};
        if (err) {
            *err = "malformed config: top level is not an object";
        }
        return false;
    }

    applyJson(root, cfg);
    return true;
}

bool saveConfig(const std::string &path, const AppConfig &cfg, std::string *err)
{
    const QString qpath = QString::fromStdString(path);
    const QString dir = QFileInfo(qpath).absolutePath();
    QDir().mkpath(dir);

    QSaveFile file(qpath);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        if (err) {
            *err = "cannot write " + path + ": " + file.errorString().toStdString();
        }
        return false;
    }

    const QByteArray data = QByteArray::fromStdString(toJson(cfg).dump(2));
    if (file.write(data) != data.size() || !file.commit()) {
        if (err) {
            *err = "cannot write " + path + ": " + file.errorString().toStdString();
        }
        return false;
    }
    return true;
}

} // namespace taskheader
