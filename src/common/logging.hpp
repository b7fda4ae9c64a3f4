#pragma once

#include <QString>

#include <nlohmann/json.hpp>

namespace taskheader::logging {

enum class LogLevel {
    Debug,
    Info,
    Warn,
    Error
};

// Initialize logging for the current process. Call early in main().
// With trace enabled, debug events are written as well and every event is
// mirrored to {process}-trace.log.
void initLogging(const QString &processName, bool traceEnabled);

bool isTraceEnabled();

// Echo warnings and errors to stderr as one short line each (used by the CLI).
void setStderrEcho(bool enabled);

// $TASKHEADER_LOG_DIR, or $HOME/.local/share/taskheader/logs.
QString logDirectoryPath();

// Thread-local correlation support for linking related log events.
void setCorrelationId(const QString &corrId);
QString currentCorrelationId();
QString newCorrelationId();

class CorrelationScope {
public:
    explicit CorrelationScope(const QString &corrId);
    ~CorrelationScope();

    CorrelationScope(const CorrelationScope &) = delete;
    CorrelationScope &operator=(const CorrelationScope &) = delete;

private:
    QString m_prev;
};

// Structured log event. All fields are required; use empty strings where unknown.
void logEvent(LogLevel level,
              const QString &processName,
              const QString &component,
              const QString &where,
              const QString &what,
              const QString &why,
              const QString &how,
              const QString &who,
              const QString &correlationId,
              const nlohmann::json &context = nlohmann::json::object());

QString defaultProcessName();
QString defaultWho();

} // namespace taskheader::logging

#define THLOG_DEBUG(component, where, what, why, how, who, corr, ctxJson) \
    ::taskheader::logging::logEvent(::taskheader::logging::LogLevel::Debug, \
                                    ::taskheader::logging::defaultProcessName(), \
                                    (component), (where), (what), (why), (how), (who), (corr), (ctxJson))

#define THLOG_INFO(component, where, what, why, how, who, corr, ctxJson) \
    ::taskheader::logging::logEvent(::taskheader::logging::LogLevel::Info, \
                                    ::taskheader::logging::defaultProcessName(), \
                                    (component), (where), (what), (why), (how), (who), (corr), (ctxJson))

#define THLOG_WARN(component, where, what, why, how, who, corr, ctxJson) \
    ::taskheader::logging::logEvent(::taskheader::logging::LogLevel::Warn, \
                                    ::taskheader::logging::defaultProcessName(), \
                                    (component), (where), (what), (why), (how), (who), (corr), (ctxJson))

#define THLOG_ERROR(component, where, what, why, how, who, corr, ctxJson) \
    ::taskheader::logging::logEvent(::taskheader::logging::LogLevel::Error, \
                                    ::taskheader::logging::defaultProcessName(), \
                                    (component), (where), (what), (why), (how), (who), (corr), (ctxJson))
