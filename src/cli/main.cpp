#include <QCoreApplication>

#include <nlohmann/json.hpp>

#include "cli/UpdateCli.hpp"
#include "common/logging.hpp"

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName(QStringLiteral("updwatch"));

    const QStringList args = QCoreApplication::arguments();
    const bool trace = qEnvironmentVariableIntValue("UPDWATCH_TRACE") == 1
        || args.contains(QStringLiteral("--trace"));
    updwatch::logging::LogSettings logSettings;
    logSettings.trace = trace;
    updwatch::logging::configureLogging(logSettings);
    UWLOG_INFO(QStringLiteral("main"),
               QStringLiteral("updwatch_start"),
               (nlohmann::json{{"args", args.size()}}));

    // One detection per process; no event loop beyond what the notifier spins locally.
    updwatch::UpdateCli cli;
    return cli.run(args);
}
