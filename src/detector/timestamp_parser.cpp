#include "detector/timestamp_parser.hpp"

#include <QDate>
#include <QRegularExpression>
#include <QTime>

namespace updwatch {

namespace {

// Log timestamps carry no zone; they are taken as local wall-clock time.
std::optional<QDateTime> buildLocal(int year, int month, int day,
                                    int hour, int minute, int second)
{
    const QDate date(year, month, day);
    const QTime time(hour, minute, second);
    if (!date.isValid() || !time.isValid()) {
        return std::nullopt;
    }
    return QDateTime(date, time);
}

std::optional<QDateTime> fromMatch(const QRegularExpressionMatch &match, int yearOffset)
{
    if (!match.hasMatch()) {
        return std::nullopt;
    }
    return buildLocal(match.captured(3).toInt() + yearOffset,
                      match.captured(2).toInt(),
                      match.captured(1).toInt(),
                      match.captured(4).toInt(),
                      match.captured(5).toInt(),
                      match.captured(6).toInt());
}

} // namespace

std::optional<QDateTime> parsePrimaryTimestamp(const QString &line)
{
    static const QRegularExpression pattern(
        QStringLiteral(R"(^(\d{2})\.(\d{2})\.(\d{4})\s+(\d{1,2}):(\d{2}):(\d{2})(?:\s|$))"));
    return fromMatch(pattern.match(line), 0);
}

std::optional<QDateTime> parseUpdateLogTimestamp(const QString &line)
{
    static const QRegularExpression pattern(
        QStringLiteral(R"(^(\d{2})\.(\d{2})\.(\d{2})\s+(\d{1,2}):(\d{2}):(\d{2})(?:\.\d{1,3})?(?:\s|$))"));
    return fromMatch(pattern.match(line), 2000);
}

std::optional<QDateTime> parseCheckpointTimestamp(const QString &text)
{
    static const QRegularExpression pattern(
        QStringLiteral(R"(^(\d{2})\.(\d{2})\.(\d{4})\s+(\d{1,2}):(\d{2}):(\d{2})$)"));
    return fromMatch(pattern.match(text.trimmed()), 0);
}

QString formatCheckpointTimestamp(const QDateTime &timestamp)
{
    return timestamp.toString(QStringLiteral("dd.MM.yyyy HH:mm:ss"));
}

} // namespace updwatch
