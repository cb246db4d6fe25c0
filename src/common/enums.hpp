#pragma once

namespace updwatch {

// Public result of one detection run. Maps 1:1 onto the process exit code.
enum class Outcome {
    Success,
    NoUpdate,
    UpdateFailed,
    Error
};

// Per-run status carried by UpdateResult. Wider than Outcome only in name;
// Failed collapses to Outcome::UpdateFailed.
enum class UpdateStatus {
    Success,
    Failed,
    NoUpdate,
    Error
};

enum class ClassificationStatus {
    Success,
    Failed
};

enum class AuditSeverity {
    Information,
    Warning,
    Error
};

// Identifies what a run reported. Integer wire ids exist only at the audit sink.
enum class EventId {
    UpdateSucceeded,
    NoUpdateDetected,
    ConfigMissingKey,
    ConfigInvalidValue,
    PrimaryLogMissing,
    SecondaryLogMissing,
    LogsDirectoryMissing,
    CheckpointDirectoryCreationFailed,
    EncodingReadError,
    UpdateValidationFailed,
    NotificationTransportError,
    CheckpointWriteError,
    Unexpected
};

int exitCodeFor(Outcome outcome);

} // namespace updwatch
