#include "cli/UpdateCli.hpp"

#include <iostream>
#include <memory>

#include <QCommandLineOption>
#include <QCommandLineParser>
#include <QDir>

#include "common/config.hpp"
#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "common/updwatch_version.hpp"
#include "detector/update_orchestrator.hpp"
#include "notify/message_formatter.hpp"
#include "notify/sqlite_audit_sink.hpp"
#include "notify/telegram_notifier.hpp"

namespace updwatch {

namespace {

QString auditDatabasePath(const AppConfig &config)
{
    const QString stateDir = config.stateDirectory.trimmed().isEmpty()
        ? defaultStateDirectory()
        : config.stateDirectory;
    return QDir(stateDir).filePath(QStringLiteral("audit.db"));
}

// Failures before a config exists go to the journal in the default state directory.
void reportStartupFailure(const StepError &error)
{
    logging::logRunFailure(QStringLiteral("UpdateCli"), error);
    SqliteAuditSink startupSink(
        QDir(defaultStateDirectory()).filePath(QStringLiteral("audit.db")));
    if (!startupSink.write(error.message, AuditSeverity::Error, eventIdFor(error.kind))) {
        UWLOG_WARN(QStringLiteral("UpdateCli"),
                   QStringLiteral("audit_sink_write_failed"),
                   (nlohmann::json{{"eventId", eventIdFor(error.kind)}}));
    }
    std::cerr << error.message.toStdString() << "\n";
}

} // namespace

int UpdateCli::run(const QStringList &args)
{
    QCommandLineParser parser;
    parser.setApplicationDescription(
        QStringLiteral("Detect whether the latest software update succeeded."));
    const QCommandLineOption helpOption(QStringList() << QStringLiteral("h")
                                                      << QStringLiteral("help"),
                                        QStringLiteral("Show this help."));
    const QCommandLineOption versionOption(QStringLiteral("version"),
                                           QStringLiteral("Show the version."));
    const QCommandLineOption configOption(QStringLiteral("config"),
                                          QStringLiteral("Configuration file."),
                                          QStringLiteral("path"),
                                          defaultConfigPath());
    const QCommandLineOption formatOption(QStringLiteral("format"),
                                          QStringLiteral("Output format: text or json."),
                                          QStringLiteral("format"),
                                          QStringLiteral("text"));
    const QCommandLineOption traceOption(QStringLiteral("trace"),
                                         QStringLiteral("Enable verbose trace logging."));
    const QCommandLineOption dryRunOption(QStringLiteral("dry-run"),
                                          QStringLiteral("Do not send chat notifications."));
    parser.addOption(helpOption);
    parser.addOption(versionOption);
    parser.addOption(configOption);
    parser.addOption(formatOption);
    parser.addOption(traceOption);
    parser.addOption(dryRunOption);

    if (!parser.parse(args)) {
        std::cerr << parser.errorText().toStdString() << "\n"
                  << parser.helpText().toStdString();
        return exitCodeFor(Outcome::Error);
    }
    if (parser.isSet(helpOption)) {
        std::cout << parser.helpText().toStdString();
        return 0;
    }
    if (parser.isSet(versionOption)) {
        std::cout << "updwatch " << UPDWATCH_VERSION << "\n";
        return 0;
    }

    const QString format = parser.value(formatOption).toLower();
    if (format != QStringLiteral("text") && format != QStringLiteral("json")) {
        std::cerr << "Unknown format: " << format.toStdString() << "\n";
        return exitCodeFor(Outcome::Error);
    }

    const QString configPath = parser.value(configOption);
    const auto loaded = loadConfigFile(configPath);
    if (!loaded.isOk()) {
        if (format == QStringLiteral("json")) {
            RunReport report;
            report.outcome = Outcome::Error;
            report.eventId = eventIdFor(loaded.error().kind);
            report.message = loaded.error().message;
            std::cout << nlohmann::json(report).dump(2) << std::endl;
        }
        reportStartupFailure(loaded.error());
        return exitCodeFor(Outcome::Error);
    }
    const AppConfig &config = loaded.value();

    SqliteAuditSink auditSink(auditDatabasePath(config));
    std::unique_ptr<Notifier> notifier;
    if (config.notification.enabled && !parser.isSet(dryRunOption)) {
        notifier = std::make_unique<TelegramNotifier>(config.notification);
    }

    UpdateOrchestrator orchestrator(notifier.get(), &auditSink);
    const RunReport report = orchestrator.run(config);

    if (format == QStringLiteral("json")) {
        std::cout << nlohmann::json(report).dump(2) << std::endl;
    } else {
        std::cout << formatRunSummary(report, config.serverName).toStdString() << std::endl;
    }
    if (report.outcome == Outcome::Error) {
        std::cerr << report.message.toStdString() << "\n";
    }

    return exitCodeFor(report.outcome);
}

} // namespace updwatch
