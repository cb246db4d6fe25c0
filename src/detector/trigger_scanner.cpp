#include "detector/trigger_scanner.hpp"

#include <QRegularExpression>

#include "common/logging.hpp"
#include "detector/timestamp_parser.hpp"

namespace updwatch {

namespace {

QRegularExpression triggerPattern(const DetectionConfig &detection)
{
    // <prefix>.<from>-<to>.upd, where the last component of <to> is captured separately.
    const QString pattern = QRegularExpression::escape(detection.packagePrefix)
        + QStringLiteral(R"(\.(\d+(?:\.\d+)*)-((?:\d+\.)*(\d+))\.upd\b)");
    return QRegularExpression(pattern, QRegularExpression::CaseInsensitiveOption);
}

std::optional<TriggerEvent> matchWith(const QRegularExpression &pattern,
                                      const QString &line,
                                      const DetectionConfig &detection)
{
    if (!detection.triggerKeyword.isEmpty()
        && !line.contains(detection.triggerKeyword, Qt::CaseInsensitive)) {
        return std::nullopt;
    }

    const QRegularExpressionMatch match = pattern.match(line);
    if (!match.hasMatch()) {
        return std::nullopt;
    }

    TriggerEvent event;
    event.fromVersion = match.captured(1);
    event.toVersion = match.captured(2);
    event.targetToken = match.captured(3);
    event.line = line;
    return event;
}

} // namespace

std::optional<TriggerEvent> matchTriggerLine(const QString &line,
                                             const DetectionConfig &detection)
{
    return matchWith(triggerPattern(detection), line, detection);
}

std::optional<TriggerEvent> findLatestTrigger(const QStringList &lines,
                                              const std::optional<QDateTime> &checkpoint,
                                              const DetectionConfig &detection)
{
    const QRegularExpression pattern = triggerPattern(detection);
    int skipped = 0;

    for (qsizetype i = lines.size() - 1; i >= 0; --i) {
        const QString &line = lines.at(i);
        const auto timestamp = parsePrimaryTimestamp(line);
        if (!timestamp.has_value()) {
            ++skipped;
            continue;
        }

        // The log is chronological; nothing before this point can qualify.
        if (checkpoint.has_value() && *timestamp < *checkpoint) {
            break;
        }

        auto event = matchWith(pattern, line, detection);
        if (!event.has_value()) {
            continue;
        }

        event->timestamp = *timestamp;
        UWLOG_INFO(QStringLiteral("TriggerScanner"),
                   QStringLiteral("trigger_found"),
                   (nlohmann::json{{"from", event->fromVersion.toStdString()},
                                   {"to", event->toVersion.toStdString()},
                                   {"lineIndex", i}}));
        return event;
    }

    UWLOG_DEBUG(QStringLiteral("TriggerScanner"),
                QStringLiteral("no_trigger"),
                (nlohmann::json{{"lines", lines.size()},
                                {"unparsable", skipped},
                                {"hasCheckpoint", checkpoint.has_value()}}));
    return std::nullopt;
}

} // namespace updwatch
