#pragma once

#include <optional>

#include <QDateTime>
#include <QString>

namespace updwatch {

// Primary log prefix: "DD.MM.YYYY H:MM:SS". Anything may follow after whitespace.
std::optional<QDateTime> parsePrimaryTimestamp(const QString &line);

// Update log prefix: "DD.MM.YY H:MM:SS[.mmm]". Years are 2000-based; milliseconds are dropped.
std::optional<QDateTime> parseUpdateLogTimestamp(const QString &line);

// Checkpoint file format: "DD.MM.YYYY HH:MM:SS" (whole content, surrounding whitespace ignored).
std::optional<QDateTime> parseCheckpointTimestamp(const QString &text);
QString formatCheckpointTimestamp(const QDateTime &timestamp);

} // namespace updwatch
