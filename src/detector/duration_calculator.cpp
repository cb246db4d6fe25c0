#include "detector/duration_calculator.hpp"

#include "detector/timestamp_parser.hpp"

namespace updwatch {

UpdateDuration computeUpdateDuration(const QStringList &lines)
{
    UpdateDuration duration;

    for (const QString &line : lines) {
        const auto timestamp = parseUpdateLogTimestamp(line);
        if (!timestamp.has_value()) {
            continue;
        }
        if (!duration.startTime.has_value()) {
            duration.startTime = *timestamp;
        }
        duration.endTime = *timestamp;
    }

    if (duration.startTime.has_value() && duration.endTime.has_value()) {
        duration.seconds = duration.startTime->secsTo(*duration.endTime);
    }
    return duration;
}

} // namespace updwatch
