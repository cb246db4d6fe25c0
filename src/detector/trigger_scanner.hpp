#pragma once

#include <optional>

#include <QDateTime>
#include <QStringList>

#include "common/config.hpp"
#include "common/models.hpp"

namespace updwatch {

/**
 * Find the most recent update trigger in the primary log.
 *
 * - lines: primary log lines in chronological order.
 * - checkpoint: triggers strictly earlier than this are ignored; a trigger in the
 *   same second as the checkpoint is still reported. Scanning stops at the first
 *   line older than the checkpoint.
 *
 * Lines without a parsable timestamp are skipped. Returns std::nullopt when no
 * trigger qualifies.
 */
std::optional<TriggerEvent> findLatestTrigger(const QStringList &lines,
                                              const std::optional<QDateTime> &checkpoint,
                                              const DetectionConfig &detection);

// Matches a single line's text against the trigger pattern, ignoring its timestamp.
std::optional<TriggerEvent> matchTriggerLine(const QString &line,
                                             const DetectionConfig &detection);

} // namespace updwatch
