#pragma once

#include <optional>
#include <string>

#include <QDateTime>
#include <QString>

#include <nlohmann/json.hpp>

#include "common/models.hpp"

namespace updwatch {

inline std::string toOutcomeString(Outcome outcome)
{
    switch (outcome) {
    case Outcome::Success:
        return "success";
    case Outcome::NoUpdate:
        return "no_update";
    case Outcome::UpdateFailed:
        return "update_failed";
    case Outcome::Error:
        return "error";
    }
    return "error";
}

inline std::string toUpdateStatusString(UpdateStatus status)
{
    switch (status) {
    case UpdateStatus::Success:
        return "success";
    case UpdateStatus::Failed:
        return "failed";
    case UpdateStatus::NoUpdate:
        return "no_update";
    case UpdateStatus::Error:
        return "error";
    }
    return "error";
}

inline std::string toEventIdString(EventId eventId)
{
    switch (eventId) {
    case EventId::UpdateSucceeded:
        return "update_succeeded";
    case EventId::NoUpdateDetected:
        return "no_update_detected";
    case EventId::ConfigMissingKey:
        return "config_missing_key";
    case EventId::ConfigInvalidValue:
        return "config_invalid_value";
    case EventId::PrimaryLogMissing:
        return "primary_log_missing";
    case EventId::SecondaryLogMissing:
        return "secondary_log_missing";
    case EventId::LogsDirectoryMissing:
        return "logs_directory_missing";
    case EventId::CheckpointDirectoryCreationFailed:
        return "checkpoint_directory_creation_failed";
    case EventId::EncodingReadError:
        return "encoding_read_error";
    case EventId::UpdateValidationFailed:
        return "update_validation_failed";
    case EventId::NotificationTransportError:
        return "notification_transport_error";
    case EventId::CheckpointWriteError:
        return "checkpoint_write_error";
    case EventId::Unexpected:
        return "unexpected";
    }
    return "unexpected";
}

// Log timestamps are zone-less local times, so they are rendered without an offset.
inline nlohmann::json toLocalIsoJson(const std::optional<QDateTime> &value)
{
    if (!value.has_value() || !value->isValid()) {
        return nullptr;
    }
    return value->toString(QStringLiteral("yyyy-MM-ddTHH:mm:ss")).toStdString();
}

inline void to_json(nlohmann::json &j, const Outcome &outcome)
{
    j = toOutcomeString(outcome);
}

inline void to_json(nlohmann::json &j, const UpdateStatus &status)
{
    j = toUpdateStatusString(status);
}

inline void to_json(nlohmann::json &j, const EventId &eventId)
{
    j = toEventIdString(eventId);
}

inline void to_json(nlohmann::json &j, const UpdateResult &result)
{
    j = nlohmann::json{
        {"status", result.status},
        {"errorId", result.errorId},
        {"fromVersion", result.fromVersion.toStdString()},
        {"toVersion", result.toVersion.toStdString()},
        {"updateTime", toLocalIsoJson(result.updateTime)},
        {"updateStartTime", toLocalIsoJson(result.updateStartTime)},
        {"updateEndTime", toLocalIsoJson(result.updateEndTime)},
        {"durationSeconds", result.durationSeconds.has_value()
                                ? nlohmann::json(*result.durationSeconds)
                                : nlohmann::json(nullptr)},
        {"reason", result.reason.toStdString()},
        {"updateLogPath", result.updateLogPath.toStdString()}
    };
}

inline void to_json(nlohmann::json &j, const RunReport &report)
{
    j = nlohmann::json{
        {"outcome", report.outcome},
        {"exitCode", exitCodeFor(report.outcome)},
        {"eventId", report.eventId},
        {"notificationSent", report.notificationSent},
        {"message", report.message.toStdString()},
        {"updateResult", report.updateResult.has_value()
                             ? nlohmann::json(*report.updateResult)
                             : nlohmann::json(nullptr)}
    };
}

} // namespace updwatch
