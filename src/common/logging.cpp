#include "common/logging.hpp"

#include <QCoreApplication>
#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>

#include <cstdio>
#include <mutex>

namespace updwatch::logging {

namespace {

std::mutex g_mutex;
LogSettings g_settings;

thread_local QString t_server;
thread_local QString t_run;

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

// Caller holds g_mutex.
QString pathFor(const LogSettings &settings, bool trace)
{
    const QString base = settings.processName.isEmpty() ? QStringLiteral("updwatch")
                                                        : settings.processName;
    return QDir(logsDirPath()).filePath(base + (trace ? QStringLiteral("-trace.log")
                                                      : QStringLiteral(".log")));
}

void appendLine(const QString &path, const QByteArray &line, qint64 rotateBytes)
{
    if (rotateBytes > 0 && QFileInfo(path).size() >= rotateBytes) {
        const QString previous = path + QStringLiteral(".1");
        QFile::remove(previous);
        QFile::rename(path, previous);
    }

    QFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Append)) {
        std::fwrite(line.constData(), 1, static_cast<size_t>(line.size()), stderr);
        return;
    }
    file.write(line);
}

} // namespace

void configureLogging(const LogSettings &settings)
{
    std::lock_guard<std::mutex> lock(g_mutex);
    g_settings = settings;
}

LogSettings currentSettings()
{
    std::lock_guard<std::mutex> lock(g_mutex);
    return g_settings;
}

QString logsDirPath()
{
    const QString home = qEnvironmentVariable("HOME");
    const QString relative = QStringLiteral(".local/share/updwatch/logs");
    return home.isEmpty() ? relative : QDir(home).filePath(relative);
}

QString logFilePath(bool trace)
{
    std::lock_guard<std::mutex> lock(g_mutex);
    return pathFor(g_settings, trace);
}

RunScope::RunScope(const QString &serverName, const QString &runId)
    : m_prevServer(t_server)
    , m_prevRun(t_run)
{
    t_server = serverName;
    t_run = runId;
}

RunScope::~RunScope()
{
    t_server = m_prevServer;
    t_run = m_prevRun;
}

QString currentServer()
{
    return t_server;
}

QString currentRunId()
{
    return t_run;
}

void logEvent(LogLevel level,
              const QString &component,
              const QString &event,
              const nlohmann::json &context)
{
    std::lock_guard<std::mutex> lock(g_mutex);
    const bool toMain = level != LogLevel::Debug || g_settings.trace;
    if (!toMain) {
        return;
    }

    const nlohmann::json line = {
        {"ts", QDateTime::currentDateTime().toString(Qt::ISODateWithMs).toStdString()},
        {"level", levelName(level)},
        {"pid", QCoreApplication::applicationPid()},
        {"process", g_settings.processName.toStdString()},
        {"server", t_server.toStdString()},
        {"run", t_run.toStdString()},
        {"component", component.toStdString()},
        {"event", event.toStdString()},
        {"context", context}
    };
    const QByteArray bytes = QByteArray::fromStdString(line.dump()) + '\n';

    QDir().mkpath(logsDirPath());
    appendLine(pathFor(g_settings, false), bytes, g_settings.rotateBytes);
    if (g_settings.trace) {
        appendLine(pathFor(g_settings, true), bytes, g_settings.rotateBytes);
    }
}

void logRunFailure(const QString &component, const StepError &error)
{
    logEvent(LogLevel::Error,
             component,
             QStringLiteral("run_failed"),
             nlohmann::json{
                 {"kind", toErrorKindString(error.kind).toStdString()},
                 {"category", toErrorCategoryString(errorCategory(error.kind)).toStdString()},
                 {"message", error.message.toStdString()}});
}

} // namespace updwatch::logging
