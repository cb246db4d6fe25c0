#include "detector/update_orchestrator.hpp"

#include <exception>

#include <QDir>
#include <QFileInfo>
#include <QLockFile>
#include <QUuid>

#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "detector/checkpoint_store.hpp"
#include "detector/duration_calculator.hpp"
#include "detector/log_reader.hpp"
#include "detector/operation_locator.hpp"
#include "detector/state_classifier.hpp"
#include "detector/timestamp_parser.hpp"
#include "detector/trigger_scanner.hpp"
#include "notify/audit_sink.hpp"
#include "notify/message_formatter.hpp"
#include "notify/notifier.hpp"

namespace updwatch {

namespace {

const QString kComponent = QStringLiteral("UpdateOrchestrator");

QString lockPathFor(const AppConfig &config)
{
    return QDir(config.stateDirectory)
        .filePath(sanitizeServerName(config.serverName) + QStringLiteral(".lock"));
}

AuditSeverity severityFor(UpdateStatus status)
{
    switch (status) {
    case UpdateStatus::Success:
    case UpdateStatus::NoUpdate:
        return AuditSeverity::Information;
    case UpdateStatus::Failed:
    case UpdateStatus::Error:
        return AuditSeverity::Error;
    }
    return AuditSeverity::Error;
}

} // namespace

UpdateOrchestrator::UpdateOrchestrator(Notifier *notifier, AuditSink *auditSink, Clock clock)
    : m_notifier(notifier)
    , m_auditSink(auditSink)
    , m_clock(clock ? std::move(clock) : Clock([] { return QDateTime::currentDateTime(); }))
{
}

RunReport UpdateOrchestrator::run(const AppConfig &config)
{
    logging::RunScope scope(config.serverName, QUuid::createUuid().toString(QUuid::WithoutBraces));

    try {
        return runPipeline(config);
    } catch (const std::exception &ex) {
        return failRun(StepError{ErrorKind::Unexpected,
                                 QStringLiteral("unexpected failure: %1")
                                     .arg(QString::fromUtf8(ex.what()))});
    } catch (...) {
        return failRun(StepError{ErrorKind::Unexpected,
                                 QStringLiteral("unexpected failure of unknown type")});
    }
}

RunReport UpdateOrchestrator::runPipeline(const AppConfig &config)
{
    RunContext context;
    context.runTime = m_clock();

    UWLOG_INFO(kComponent,
               QStringLiteral("detection_start"),
               (nlohmann::json{{"runTime", formatCheckpointTimestamp(context.runTime).toStdString()}}));

    if (const auto valid = validateConfig(config); !valid.isOk()) {
        return failRun(valid.error());
    }

    const auto checkpointPath = resolveCheckpointPath(config);
    if (!checkpointPath.isOk()) {
        return failRun(checkpointPath.error());
    }
    context.checkpointPath = checkpointPath.value();

    // Overlapping runs would race on the checkpoint; serialize them.
    QLockFile runLock(lockPathFor(config));
    // Reclaimed only once the owning process is gone, whatever the file age.
    runLock.setStaleLockTime(0);
    if (!runLock.tryLock(config.lockTimeoutMs)) {
        return failRun(StepError{ErrorKind::Unexpected,
                                 QStringLiteral("another run holds %1 (lock error %2)")
                                     .arg(lockPathFor(config))
                                     .arg(static_cast<int>(runLock.error()))});
    }

    if (const auto logsDir = ensureLogsDirectory(config); !logsDir.isOk()) {
        return failRun(logsDir.error());
    }

    const CheckpointStore checkpoints(context.checkpointPath);
    context.checkpoint = checkpoints.read();

    const auto trigger = scanPrimaryLog(config, context);
    if (!trigger.isOk()) {
        return failRun(trigger.error());
    }
    if (!trigger.value().has_value()) {
        return finishNoUpdate(config, context);
    }

    const auto classified = classifyTrigger(config, *trigger.value());
    if (!classified.isOk()) {
        return failRun(classified.error());
    }
    return finishUpdate(config, context, classified.value());
}

StepResult<QString> UpdateOrchestrator::resolveCheckpointPath(const AppConfig &config) const
{
    const CheckpointStore store(checkpointPathFor(config));
    const auto dir = store.ensureDirectory();
    if (!dir.isOk()) {
        return StepResult<QString>::err(dir.error());
    }
    return StepResult<QString>::ok(store.path());
}

StepResult<void> UpdateOrchestrator::ensureLogsDirectory(const AppConfig &config) const
{
    if (!QFileInfo(config.logsDirectory).isDir()) {
        return StepResult<void>::err(
            ErrorKind::LogsDirectoryMissing,
            QStringLiteral("logs directory not found: %1").arg(config.logsDirectory));
    }
    return StepResult<void>::ok();
}

StepResult<std::optional<TriggerEvent>> UpdateOrchestrator::scanPrimaryLog(
    const AppConfig &config,
    const RunContext &context) const
{
    using Result = StepResult<std::optional<TriggerEvent>>;

    const QString path = primaryLogPathFor(config);
    const auto text = readLogText(path, config.detection.encoding, ErrorKind::PrimaryLogMissing);
    if (!text.isOk()) {
        return Result::err(text.error());
    }

    return Result::ok(findLatestTrigger(splitLogLines(text.value()),
                                        context.checkpoint,
                                        config.detection));
}

StepResult<UpdateResult> UpdateOrchestrator::classifyTrigger(const AppConfig &config,
                                                             const TriggerEvent &trigger) const
{
    UpdateResult result;
    result.fromVersion = trigger.fromVersion;
    result.toVersion = trigger.toVersion;
    result.updateTime = trigger.timestamp;
    result.updateLogPath = updateLogPathFor(config, trigger.timestamp.date());

    const auto text = readLogText(result.updateLogPath,
                                  config.detection.encoding,
                                  ErrorKind::SecondaryLogMissing);
    if (!text.isOk()) {
        if (text.error().kind != ErrorKind::SecondaryLogMissing) {
            return StepResult<UpdateResult>::err(text.error());
        }
        // Without the update log there is nothing to validate.
        result.status = UpdateStatus::Failed;
        result.errorId = EventId::SecondaryLogMissing;
        result.reason = QStringLiteral("update log not found: %1").arg(result.updateLogPath);
        return StepResult<UpdateResult>::ok(result);
    }

    const OperationBlock block = locateLastOperation(text.value(), config.detection);
    const StateClassifier classifier(config.detection);
    const ClassificationResult verdict = classifier.classifyBlock(block, trigger.targetToken);
    const UpdateDuration duration = computeUpdateDuration(splitLogLines(text.value()));

    result.updateStartTime = duration.startTime;
    result.updateEndTime = duration.endTime;
    result.durationSeconds = duration.seconds;
    result.reason = verdict.reason;
    if (verdict.status == ClassificationStatus::Success) {
        result.status = UpdateStatus::Success;
        result.errorId = EventId::UpdateSucceeded;
    } else {
        result.status = UpdateStatus::Failed;
        result.errorId = EventId::UpdateValidationFailed;
    }

    UWLOG_INFO(kComponent,
               QStringLiteral("update_classified"),
               (nlohmann::json{{"status", result.status},
                               {"operationFound", verdict.operationFound},
                               {"versionConfirmed", verdict.versionConfirmed},
                               {"completionConfirmed", verdict.completionConfirmed},
                               {"toVersion", result.toVersion.toStdString()}}));
    return StepResult<UpdateResult>::ok(result);
}

RunReport UpdateOrchestrator::finishNoUpdate(const AppConfig &config, const RunContext &context)
{
    const CheckpointStore checkpoints(context.checkpointPath);
    if (const auto written = checkpoints.write(context.runTime); !written.isOk()) {
        return failRun(written.error());
    }

    RunReport report;
    report.outcome = Outcome::NoUpdate;
    report.eventId = EventId::NoUpdateDetected;
    report.message = context.checkpoint.has_value()
        ? QStringLiteral("no update since %1").arg(formatCheckpointTimestamp(*context.checkpoint))
        : QStringLiteral("no update found in %1").arg(primaryLogPathFor(config));

    audit(report.message, AuditSeverity::Information, report.eventId);
    UWLOG_INFO(kComponent,
               QStringLiteral("no_update"),
               (nlohmann::json{{"checkpoint", formatCheckpointTimestamp(context.runTime).toStdString()}}));
    return report;
}

RunReport UpdateOrchestrator::finishUpdate(const AppConfig &config,
                                           const RunContext &context,
                                           const UpdateResult &result)
{
    const CheckpointStore checkpoints(context.checkpointPath);
    if (const auto written = checkpoints.write(context.runTime); !written.isOk()) {
        return failRun(written.error(), result);
    }

    RunReport report;
    report.outcome = result.status == UpdateStatus::Success ? Outcome::Success
                                                            : Outcome::UpdateFailed;
    report.eventId = result.errorId;
    report.updateResult = result;
    report.message = result.reason;

    const QString text = formatNotification(result, config.serverName);

    std::optional<QString> notifyError;
    if (m_notifier) {
        const NotifyResult sent = m_notifier->send(text);
        if (sent.ok) {
            report.notificationSent = true;
        } else {
            notifyError = sent.error;
        }
    } else {
        UWLOG_INFO(kComponent,
                   QStringLiteral("notification_skipped"),
                   nlohmann::json::object());
    }

    audit(text, severityFor(result.status), report.eventId);

    // The checkpoint stays written; the trigger is not retried.
    if (notifyError.has_value()) {
        return failRun(StepError{ErrorKind::NotificationTransportError,
                                 QStringLiteral("notification failed: %1").arg(*notifyError)},
                       result);
    }

    UWLOG_INFO(kComponent,
               QStringLiteral("detection_complete"),
               (nlohmann::json{{"outcome", report.outcome},
                               {"eventId", report.eventId},
                               {"notificationSent", report.notificationSent}}));
    return report;
}

RunReport UpdateOrchestrator::failRun(const StepError &error,
                                      std::optional<UpdateResult> updateResult)
{
    RunReport report;
    report.outcome = Outcome::Error;
    report.eventId = eventIdFor(error.kind);
    report.notificationSent = false;
    report.updateResult = std::move(updateResult);
    report.message = error.message;

    logging::logRunFailure(kComponent, error);
    audit(error.message, AuditSeverity::Error, report.eventId);
    return report;
}

void UpdateOrchestrator::audit(const QString &text, AuditSeverity severity, EventId eventId)
{
    if (!m_auditSink) {
        return;
    }
    if (!m_auditSink->write(text, severity, eventId)) {
        UWLOG_WARN(kComponent,
                   QStringLiteral("audit_sink_write_failed"),
                   (nlohmann::json{{"eventId", eventId}}));
    }
}

} // namespace updwatch
