#include "notify/message_formatter.hpp"

#include <QStringList>

namespace updwatch {

namespace {

QString formatTime(const std::optional<QDateTime> &value)
{
    if (!value.has_value() || !value->isValid()) {
        return QStringLiteral("-");
    }
    return value->toString(QStringLiteral("dd.MM.yyyy HH:mm:ss"));
}

QString headline(UpdateStatus status)
{
    switch (status) {
    case UpdateStatus::Success:
        return QStringLiteral("Update succeeded");
    case UpdateStatus::Failed:
        return QStringLiteral("Update FAILED");
    case UpdateStatus::NoUpdate:
        return QStringLiteral("No update detected");
    case UpdateStatus::Error:
        return QStringLiteral("Update check error");
    }
    return QStringLiteral("Update check error");
}

} // namespace

QString formatDuration(qint64 seconds)
{
    if (seconds < 0) {
        seconds = 0;
    }
    const qint64 hours = seconds / 3600;
    const qint64 minutes = (seconds % 3600) / 60;
    const qint64 secs = seconds % 60;

    if (hours > 0) {
        return QStringLiteral("%1h %2m %3s")
            .arg(hours)
            .arg(minutes, 2, 10, QLatin1Char('0'))
            .arg(secs, 2, 10, QLatin1Char('0'));
    }
    if (minutes > 0) {
        return QStringLiteral("%1m %2s").arg(minutes).arg(secs, 2, 10, QLatin1Char('0'));
    }
    return QStringLiteral("%1s").arg(secs);
}

QString formatNotification(const UpdateResult &result, const QString &serverName)
{
    QStringList lines;
    lines << QStringLiteral("[%1] %2").arg(serverName, headline(result.status));

    if (!result.fromVersion.isEmpty() || !result.toVersion.isEmpty()) {
        lines << QStringLiteral("Version: %1 -> %2").arg(result.fromVersion, result.toVersion);
    }
    if (result.updateTime.has_value()) {
        lines << QStringLiteral("Started: %1").arg(formatTime(result.updateTime));
    }
    if (result.updateStartTime.has_value() || result.updateEndTime.has_value()) {
        lines << QStringLiteral("Update log: %1 .. %2")
                     .arg(formatTime(result.updateStartTime), formatTime(result.updateEndTime));
    }
    if (result.durationSeconds.has_value()) {
        lines << QStringLiteral("Duration: %1").arg(formatDuration(*result.durationSeconds));
    }
    if (!result.reason.isEmpty()) {
        lines << QStringLiteral("Reason: %1").arg(result.reason);
    }
    if (!result.updateLogPath.isEmpty()) {
        lines << QStringLiteral("Log: %1").arg(result.updateLogPath);
    }
    return lines.join(QLatin1Char('\n'));
}

QString formatRunSummary(const RunReport &report, const QString &serverName)
{
    if (report.updateResult.has_value()) {
        QString text = formatNotification(*report.updateResult, serverName);
        if (report.outcome == Outcome::Error && !report.message.isEmpty()) {
            text += QStringLiteral("\nError: ") + report.message;
        }
        return text;
    }
    if (report.outcome == Outcome::Error) {
        return QStringLiteral("[%1] Update check error: %2").arg(serverName, report.message);
    }
    return QStringLiteral("[%1] %2").arg(serverName, report.message);
}

} // namespace updwatch
