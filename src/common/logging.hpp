#pragma once

#include <QString>

#include <nlohmann/json.hpp>

#include "common/errors.hpp"

namespace updwatch::logging {

enum class LogLevel {
    Debug,
    Info,
    Warn,
    Error
};

struct LogSettings {
    QString processName = QStringLiteral("updwatch");
    // Debug lines are kept, and every line is mirrored to <process>-trace.log.
    bool trace = false;
    // A file at or above this size is moved to "<file>.1" before the next write.
    qint64 rotateBytes = 5 * 1024 * 1024;
};

void configureLogging(const LogSettings &settings);
LogSettings currentSettings();

// $HOME/.local/share/updwatch/logs
QString logsDirPath();
QString logFilePath(bool trace);

// Stamps the server name and run id on every line this thread writes until
// the scope ends. Scopes nest; the previous values come back on exit.
class RunScope
{
public:
    RunScope(const QString &serverName, const QString &runId);
    ~RunScope();

    RunScope(const RunScope &) = delete;
    RunScope &operator=(const RunScope &) = delete;

private:
    QString m_prevServer;
    QString m_prevRun;
};

QString currentServer();
QString currentRunId();

// One JSON object per line: ts, level, pid, process, server, run, component, event, context.
void logEvent(LogLevel level,
              const QString &component,
              const QString &event,
              const nlohmann::json &context = nlohmann::json::object());

// ERROR "run_failed" line. context.message is error.message verbatim, the same
// text the audit sink receives for the run.
void logRunFailure(const QString &component, const StepError &error);

} // namespace updwatch::logging

#define UWLOG_DEBUG(component, event, ctxJson) \
    ::updwatch::logging::logEvent(::updwatch::logging::LogLevel::Debug, (component), (event), (ctxJson))

#define UWLOG_INFO(component, event, ctxJson) \
    ::updwatch::logging::logEvent(::updwatch::logging::LogLevel::Info, (component), (event), (ctxJson))

#define UWLOG_WARN(component, event, ctxJson) \
    ::updwatch::logging::logEvent(::updwatch::logging::LogLevel::Warn, (component), (event), (ctxJson))

#define UWLOG_ERROR(component, event, ctxJson) \
    ::updwatch::logging::logEvent(::updwatch::logging::LogLevel::Error, (component), (event), (ctxJson))
