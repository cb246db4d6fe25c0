#pragma once

#include <functional>
#include <optional>

#include <QDateTime>
#include <QString>

#include "common/config.hpp"
#include "common/errors.hpp"
#include "common/models.hpp"

namespace updwatch {

class AuditSink;
class Notifier;

/**
 * UpdateOrchestrator runs one detection:
 * validate config -> resolve checkpoint -> check logs directory -> read checkpoint
 * -> scan primary log -> classify update log -> persist checkpoint -> notify -> audit.
 *
 * The checkpoint is written before the notifier is called, so a trigger is
 * notified at most once even when delivery fails. Collaborators are borrowed;
 * a null notifier means notifications are disabled for this run.
 */
class UpdateOrchestrator
{
public:
    using Clock = std::function<QDateTime()>;

    UpdateOrchestrator(Notifier *notifier, AuditSink *auditSink, Clock clock = Clock());

    // Never throws; unexpected faults come back as Outcome::Error / EventId::Unexpected.
    RunReport run(const AppConfig &config);

private:
    struct RunContext {
        QDateTime runTime;
        QString checkpointPath;
        std::optional<QDateTime> checkpoint;
    };

    RunReport runPipeline(const AppConfig &config);

    StepResult<QString> resolveCheckpointPath(const AppConfig &config) const;
    StepResult<void> ensureLogsDirectory(const AppConfig &config) const;
    StepResult<std::optional<TriggerEvent>> scanPrimaryLog(const AppConfig &config,
                                                           const RunContext &context) const;
    StepResult<UpdateResult> classifyTrigger(const AppConfig &config,
                                             const TriggerEvent &trigger) const;

    RunReport finishNoUpdate(const AppConfig &config, const RunContext &context);
    RunReport finishUpdate(const AppConfig &config, const RunContext &context,
                           const UpdateResult &result);
    RunReport failRun(const StepError &error,
                      std::optional<UpdateResult> updateResult = std::nullopt);

    void audit(const QString &text, AuditSeverity severity, EventId eventId);

    Notifier *m_notifier;
    AuditSink *m_auditSink;
    Clock m_clock;
};

} // namespace updwatch
