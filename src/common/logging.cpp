#include "common/logging.hpp"

#include <QCoreApplication>
#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QThread>
#include <QUuid>

#include <unistd.h>

#include <cstdio>
#include <map>
#include <memory>
#include <mutex>

namespace taskheader::logging {

namespace {

constexpr qint64 kMaxLogSizeBytes = 5 * 1024 * 1024;

std::mutex g_logMutex;
bool g_traceEnabled = false;
bool g_stderrEcho = false;
QString g_processName;

thread_local QString t_corrId;

const char *levelName(LogLevel level)
{
    switch (level) {
    case LogLevel::Debug:
        return "DEBUG";
    case LogLevel::Info:
        return "INFO";
    case LogLevel::Warn:
        return "WARN";
    case LogLevel::Error:
        return "ERROR";
    }
    return "INFO";
}

constexpr int kRotatedGenerations = 3;

// One open log file. Kept open between events and reopened when the file
// disappears underneath it or reaches the size limit.
struct LogChannel {
    std::unique_ptr<QFile> file;
    qint64 bytesWritten = 0;
};

std::map<QString, LogChannel> g_channels;
quint64 g_sequence = 0;

QString channelPath(const QString &processName, const QString &suffix)
{
    const QString base = processName.isEmpty()
        ? QStringLiteral("taskheader")
        : processName;
    return logDirectoryPath() + QDir::separator() + base + suffix;
}

// foo.log -> foo.log.1 -> foo.log.2 ...; the oldest generation is dropped.
void shiftGenerations(const QString &path)
{
    QFile::remove(path + QStringLiteral(".%1").arg(kRotatedGenerations));
    for (int gen = kRotatedGenerations - 1; gen >= 1; --gen) {
        QFile::rename(path + QStringLiteral(".%1").arg(gen),
                      path + QStringLiteral(".%1").arg(gen + 1));
    }
    QFile::rename(path, path + QStringLiteral(".1"));
}

QFile *openChannel(const QString &path, LogChannel &channel)
{
    if (channel.file && channel.file->isOpen() && QFileInfo::exists(path)
        && channel.bytesWritten < kMaxLogSizeBytes) {
        return channel.file.get();
    }

    channel.file.reset();
    QDir().mkpath(QFileInfo(path).absolutePath());
    if (QFileInfo(path).size() >= kMaxLogSizeBytes) {
        shiftGenerations(path);
    }

    auto file = std::make_unique<QFile>(path);
    if (!file->open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
        return nullptr;
    }
    channel.bytesWritten = file->size();
    channel.file = std::move(file);
    return channel.file.get();
}

void writeToChannel(const QString &path, const QByteArray &line)
{
    LogChannel &channel = g_channels[path];
    QFile *file = openChannel(path, channel);
    if (!file) {
        std::fprintf(stderr, "%s\n", line.constData());
        return;
    }

    file->write(line);
    file->write("\n");
    file->flush();
    channel.bytesWritten += line.size() + 1;
}

QString threadIdString()
{
    return QStringLiteral("0x%1")
        .arg(reinterpret_cast<quintptr>(QThread::currentThreadId()), 0, 16);
}

void echoToStderr(LogLevel level,
                  const QString &component,
                  const QString &what,
                  const nlohmann::json &context)
{
    std::string line = std::string("taskheader: ") + levelName(level) + " "
        + component.toStdString() + ": " + what.toStdString();
    if (context.is_object() && context.contains("error")
        && context.at("error").is_string()) {
        line += " (" + context.at("error").get<std::string>() + ")";
    }
    std::fprintf(stderr, "%s\n", line.c_str());
}

} // namespace

void initLogging(const QString &processName, bool traceEnabled)
{
    std::lock_guard<std::mutex> lock(g_logMutex);
    g_processName = processName;
    g_traceEnabled = traceEnabled;
    g_channels.clear();
}

bool isTraceEnabled()
{
    std::lock_guard<std::mutex> lock(g_logMutex);
    return g_traceEnabled;
}

void setStderrEcho(bool enabled)
{
    std::lock_guard<std::mutex> lock(g_logMutex);
    g_stderrEcho = enabled;
}

QString logDirectoryPath()
{
    const QString overrideDir = qEnvironmentVariable("TASKHEADER_LOG_DIR");
    if (!overrideDir.isEmpty()) {
        return overrideDir;
    }
    const QString home = qEnvironmentVariable("HOME");
    if (home.isEmpty()) {
        return QStringLiteral(".local/share/taskheader/logs");
    }
    return home + QStringLiteral("/.local/share/taskheader/logs");
}

void setCorrelationId(const QString &corrId)
{
    t_corrId = corrId;
}

QString currentCorrelationId()
{
    return t_corrId;
}

QString newCorrelationId()
{
    // First block of a UUID is plenty to tell concurrent cycles apart.
    return QUuid::createUuid().toString(QUuid::WithoutBraces).left(8);
}

CorrelationScope::CorrelationScope(const QString &corrId)
    : m_prev(t_corrId)
{
    t_corrId = corrId;
}

CorrelationScope::~CorrelationScope()
{
    t_corrId = m_prev;
}

QString defaultProcessName()
{
    {
        std::lock_guard<std::mutex> lock(g_logMutex);
        if (!g_processName.isEmpty()) {
            return g_processName;
        }
    }
    if (QCoreApplication::instance()) {
        const QString appName = QCoreApplication::applicationName();
        if (!appName.isEmpty()) {
            return appName;
        }
    }
    return QStringLiteral("taskheader");
}

QString defaultWho()
{
    static const QString who = []() {
        char hostname[256] = {};
        if (gethostname(hostname, sizeof(hostname)) != 0) {
            hostname[0] = '\0';
        }
        return QStringLiteral("host:%1,uid:%2")
            .arg(QString::fromUtf8(hostname))
            .arg(static_cast<int>(getuid()));
    }();
    return who;
}

void logEvent(LogLevel level,
              const QString &processName,
              const QString &component,
              const QString &where,
              const QString &what,
              const QString &why,
              const QString &how,
              const QString &who,
              const QString &correlationId,
              const nlohmann::json &context)
{
    const QString corr = correlationId.isEmpty() ? currentCorrelationId() : correlationId;
    const QString process = processName.isEmpty() ? defaultProcessName() : processName;

    std::lock_guard<std::mutex> lock(g_logMutex);
    const bool toMain = level != LogLevel::Debug || g_traceEnabled;
    const bool toStderr = g_stderrEcho && (level == LogLevel::Warn || level == LogLevel::Error);
    if (!toMain && !toStderr) {
        return;
    }

    // seq orders events of one process even when timestamps collide.
    const nlohmann::json payload = {
        {"ts", QDateTime::currentDateTimeUtc().toString(Qt::ISODateWithMs).toStdString()},
        {"seq", ++g_sequence},
        {"level", levelName(level)},
        {"process", process.toStdString()},
        {"thread", threadIdString().toStdString()},
        {"component", component.toStdString()},
        {"where", where.toStdString()},
        {"what", what.toStdString()},
        {"why", why.toStdString()},
        {"how", how.toStdString()},
        {"who", who.toStdString()},
        {"corr", corr.toStdString()},
        {"context", context}
    };

    if (toMain) {
        // Non-UTF-8 bytes in remote payloads must not abort logging.
        const QByteArray line = QByteArray::fromStdString(
            payload.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace));
        writeToChannel(channelPath(process, QStringLiteral(".log")), line);
        if (g_traceEnabled) {
            writeToChannel(channelPath(process, QStringLiteral("-trace.log")), line);
        }
    }
    if (toStderr) {
        echoToStderr(level, component, what, context);
    }
}

} // namespace taskheader::logging
