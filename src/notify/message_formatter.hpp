#pragma once

#include <QString>

#include "common/models.hpp"

namespace updwatch {

// Human-readable chat/console text for a classified update.
QString formatNotification(const UpdateResult &result, const QString &serverName);

// Plain-text description of a whole run, used for console output.
QString formatRunSummary(const RunReport &report, const QString &serverName);

// Renders whole seconds as "1h 02m 03s", "45m 23s" or "12s".
QString formatDuration(qint64 seconds);

} // namespace updwatch
