#pragma once

#include <optional>

#include <QDateTime>
#include <QString>

#include "common/enums.hpp"

namespace updwatch {

// A primary-log line announcing that an update package started downloading.
struct TriggerEvent {
    QDateTime timestamp;
    QString fromVersion;
    QString toVersion;
    // Last numeric component of toVersion, used for exact marker matching.
    QString targetToken;
    QString line;
};

enum class BlockState {
    Found,
    NoEndMarker,
    // End marker present but no start marker before it: malformed log.
    EndWithoutStart
};

struct OperationBlock {
    qsizetype startOffset = -1;
    qsizetype endOffset = -1;
    QString content;
    bool found = false;
    BlockState state = BlockState::NoEndMarker;
    // Offset of the completion marker when one was seen, even if the block is malformed.
    qsizetype endMarkerOffset = -1;
};

struct MarkerResult {
    bool versionConfirmed = false;
    bool completionConfirmed = false;
};

struct ClassificationResult {
    ClassificationStatus status = ClassificationStatus::Failed;
    bool versionConfirmed = false;
    bool completionConfirmed = false;
    bool operationFound = false;
    QString reason;
};

struct UpdateDuration {
    std::optional<QDateTime> startTime;
    std::optional<QDateTime> endTime;
    std::optional<qint64> seconds;
};

struct UpdateResult {
    UpdateStatus status = UpdateStatus::NoUpdate;
    EventId errorId = EventId::NoUpdateDetected;
    QString fromVersion;
    QString toVersion;
    std::optional<QDateTime> updateTime;
    std::optional<QDateTime> updateStartTime;
    std::optional<QDateTime> updateEndTime;
    std::optional<qint64> durationSeconds;
    QString reason;
    QString updateLogPath;
};

struct RunReport {
    Outcome outcome = Outcome::Error;
    EventId eventId = EventId::Unexpected;
    bool notificationSent = false;
    std::optional<UpdateResult> updateResult;
    QString message;
};

} // namespace updwatch
