#pragma once

#include <QString>

#include <nlohmann/json.hpp>

#include "common/errors.hpp"

namespace updwatch {

// Literals and patterns used to recognize an update in the two logs.
struct DetectionConfig {
    QString encoding = QStringLiteral("UTF-8");
    QString packagePrefix = QStringLiteral("ezvit");
    QString triggerKeyword;
    QString startMarker = QStringLiteral("Update operation started");
    QString completionMarker = QStringLiteral("Update operation completed");
    QString versionPhrase = QStringLiteral("program version");
};

struct NotificationConfig {
    bool enabled = false;
    QString apiUrl = QStringLiteral("https://api.telegram.org");
    QString botToken;
    QString chatId;
    int timeoutMs = 15000;
};

struct AppConfig {
    QString serverName;
    QString logsDirectory;
    QString primaryLog = QStringLiteral("ezvit.log");
    QString updateLogPattern = QStringLiteral("update_{date}.log");
    QString stateDirectory;
    int lockTimeoutMs = 30000;
    DetectionConfig detection;
    NotificationConfig notification;
};

QString defaultConfigPath();
QString defaultStateDirectory();

// Reads and parses the JSON file. Shape errors (unreadable file, bad JSON,
// wrong value types) are reported here; required-key checks live in validateConfig.
StepResult<AppConfig> loadConfigFile(const QString &path);
StepResult<AppConfig> parseConfigJson(const nlohmann::json &root);

StepResult<void> validateConfig(const AppConfig &config);

// Replaces every character other than [A-Za-z0-9-] with '_'.
QString sanitizeServerName(const QString &serverName);

QString checkpointPathFor(const AppConfig &config);
QString primaryLogPathFor(const AppConfig &config);
QString updateLogPathFor(const AppConfig &config, const QDate &date);

} // namespace updwatch
