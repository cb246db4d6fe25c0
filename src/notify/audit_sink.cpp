#include "notify/audit_sink.hpp"

namespace updwatch {

namespace {

constexpr int kInfoBase = 1000;
constexpr int kConfigBase = 1100;
constexpr int kEnvironmentBase = 1200;
constexpr int kValidationBase = 1300;
constexpr int kTransportBase = 1400;
constexpr int kPersistenceBase = 1500;
constexpr int kGeneralBase = 1900;

} // namespace

int wireEventId(EventId eventId)
{
    switch (eventId) {
    case EventId::UpdateSucceeded:
        return kInfoBase;
    case EventId::NoUpdateDetected:
        return kInfoBase + 1;
    case EventId::ConfigMissingKey:
        return kConfigBase;
    case EventId::ConfigInvalidValue:
        return kConfigBase + 1;
    case EventId::PrimaryLogMissing:
        return kEnvironmentBase;
    case EventId::SecondaryLogMissing:
        return kEnvironmentBase + 1;
    case EventId::LogsDirectoryMissing:
        return kEnvironmentBase + 2;
    case EventId::CheckpointDirectoryCreationFailed:
        return kEnvironmentBase + 3;
    case EventId::EncodingReadError:
        return kEnvironmentBase + 4;
    case EventId::UpdateValidationFailed:
        return kValidationBase;
    case EventId::NotificationTransportError:
        return kTransportBase;
    case EventId::CheckpointWriteError:
        return kPersistenceBase;
    case EventId::Unexpected:
        return kGeneralBase;
    }
    return kGeneralBase;
}

QString toAuditSeverityString(AuditSeverity severity)
{
    switch (severity) {
    case AuditSeverity::Information:
        return QStringLiteral("information");
    case AuditSeverity::Warning:
        return QStringLiteral("warning");
    case AuditSeverity::Error:
        return QStringLiteral("error");
    }
    return QStringLiteral("information");
}

} // namespace updwatch
