#include "common/errors.hpp"

namespace updwatch {

ErrorCategory errorCategory(ErrorKind kind)
{
    switch (kind) {
    case ErrorKind::ConfigMissingKey:
    case ErrorKind::ConfigInvalidValue:
        return ErrorCategory::Config;
    case ErrorKind::PrimaryLogMissing:
    case ErrorKind::SecondaryLogMissing:
    case ErrorKind::LogsDirectoryMissing:
    case ErrorKind::CheckpointDirectoryCreationFailed:
    case ErrorKind::EncodingReadError:
        return ErrorCategory::Environment;
    case ErrorKind::UpdateValidationFailed:
        return ErrorCategory::Validation;
    case ErrorKind::NotificationTransportError:
        return ErrorCategory::Transport;
    case ErrorKind::CheckpointWriteError:
        return ErrorCategory::Persistence;
    case ErrorKind::Unexpected:
        return ErrorCategory::General;
    }
    return ErrorCategory::General;
}

EventId eventIdFor(ErrorKind kind)
{
    switch (kind) {
    case ErrorKind::ConfigMissingKey:
        return EventId::ConfigMissingKey;
    case ErrorKind::ConfigInvalidValue:
        return EventId::ConfigInvalidValue;
    case ErrorKind::PrimaryLogMissing:
        return EventId::PrimaryLogMissing;
    case ErrorKind::SecondaryLogMissing:
        return EventId::SecondaryLogMissing;
    case ErrorKind::LogsDirectoryMissing:
        return EventId::LogsDirectoryMissing;
    case ErrorKind::CheckpointDirectoryCreationFailed:
        return EventId::CheckpointDirectoryCreationFailed;
    case ErrorKind::EncodingReadError:
        return EventId::EncodingReadError;
    case ErrorKind::UpdateValidationFailed:
        return EventId::UpdateValidationFailed;
    case ErrorKind::NotificationTransportError:
        return EventId::NotificationTransportError;
    case ErrorKind::CheckpointWriteError:
        return EventId::CheckpointWriteError;
    case ErrorKind::Unexpected:
        return EventId::Unexpected;
    }
    return EventId::Unexpected;
}

QString toErrorKindString(ErrorKind kind)
{
    switch (kind) {
    case ErrorKind::ConfigMissingKey:
        return QStringLiteral("config_missing_key");
    case ErrorKind::ConfigInvalidValue:
        return QStringLiteral("config_invalid_value");
    case ErrorKind::PrimaryLogMissing:
        return QStringLiteral("primary_log_missing");
    case ErrorKind::SecondaryLogMissing:
        return QStringLiteral("secondary_log_missing");
    case ErrorKind::LogsDirectoryMissing:
        return QStringLiteral("logs_directory_missing");
    case ErrorKind::CheckpointDirectoryCreationFailed:
        return QStringLiteral("checkpoint_directory_creation_failed");
    case ErrorKind::EncodingReadError:
        return QStringLiteral("encoding_read_error");
    case ErrorKind::UpdateValidationFailed:
        return QStringLiteral("update_validation_failed");
    case ErrorKind::NotificationTransportError:
        return QStringLiteral("notification_transport_error");
    case ErrorKind::CheckpointWriteError:
        return QStringLiteral("checkpoint_write_error");
    case ErrorKind::Unexpected:
        return QStringLiteral("unexpected");
    }
    return QStringLiteral("unexpected");
}

QString toErrorCategoryString(ErrorCategory category)
{
    switch (category) {
    case ErrorCategory::Config:
        return QStringLiteral("config");
    case ErrorCategory::Environment:
        return QStringLiteral("environment");
    case ErrorCategory::Validation:
        return QStringLiteral("validation");
    case ErrorCategory::Transport:
        return QStringLiteral("transport");
    case ErrorCategory::Persistence:
        return QStringLiteral("persistence");
    case ErrorCategory::General:
        return QStringLiteral("general");
    }
    return QStringLiteral("general");
}

int exitCodeFor(Outcome outcome)
{
    switch (outcome) {
    case Outcome::Success:
    case Outcome::NoUpdate:
        return 0;
    case Outcome::UpdateFailed:
        return 2;
    case Outcome::Error:
        return 1;
    }
    return 1;
}

} // namespace updwatch
