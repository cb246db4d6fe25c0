#include "common/config.hpp"

#include <QDate>
#include <QDir>
#include <QFile>
#include <QRegularExpression>
#include <QStringDecoder>

#include <cstdint>
#include <limits>
#include <string>

namespace updwatch {

namespace {

QString homePath()
{
    return qEnvironmentVariable("HOME");
}

QString keyPath(const std::string &section, const std::string &key)
{
    if (section.empty()) {
        return QString::fromStdString(key);
    }
    return QString::fromStdString(section + "." + key);
}

// Copies a string member when present; fails if the value has another type.
std::optional<StepError> readString(const nlohmann::json &obj,
                                    const std::string &section,
                                    const std::string &key,
                                    QString &out)
{
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) {
        return std::nullopt;
    }
    if (!it->is_string()) {
        return StepError{ErrorKind::ConfigInvalidValue,
                         QStringLiteral("config key '%1' must be a string")
                             .arg(keyPath(section, key))};
    }
    out = QString::fromStdString(it->get<std::string>());
    return std::nullopt;
}

std::optional<StepError> readInt(const nlohmann::json &obj,
                                 const std::string &section,
                                 const std::string &key,
                                 int &out)
{
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) {
        return std::nullopt;
    }
    if (!it->is_number_integer()) {
        return StepError{ErrorKind::ConfigInvalidValue,
                         QStringLiteral("config key '%1' must be an integer")
                             .arg(keyPath(section, key))};
    }
    const bool inRange = it->is_number_unsigned()
        ? it->get<std::uint64_t>() <= static_cast<std::uint64_t>(std::numeric_limits<int>::max())
        : it->get<std::int64_t>() >= std::numeric_limits<int>::min()
            && it->get<std::int64_t>() <= std::numeric_limits<int>::max();
    if (!inRange) {
        return StepError{ErrorKind::ConfigInvalidValue,
                         QStringLiteral("config key '%1' is out of range")
                             .arg(keyPath(section, key))};
    }
    out = static_cast<int>(it->get<std::int64_t>());
    return std::nullopt;
}

std::optional<StepError> readBool(const nlohmann::json &obj,
                                  const std::string &section,
                                  const std::string &key,
                                  bool &out)
{
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) {
        return std::nullopt;
    }
    if (!it->is_boolean()) {
        return StepError{ErrorKind::ConfigInvalidValue,
                         QStringLiteral("config key '%1' must be true or false")
                             .arg(keyPath(section, key))};
    }
    out = it->get<bool>();
    return std::nullopt;
}

bool isKnownEncoding(const QString &encoding)
{
    const QByteArray name = encoding.toUtf8();
    QStringDecoder decoder(name.constData());
    return decoder.isValid();
}

QString resolveAgainst(const QString &base, const QString &path)
{
    if (QDir::isAbsolutePath(path)) {
        return QDir::cleanPath(path);
    }
    return QDir::cleanPath(QDir(base).filePath(path));
}

} // namespace

QString defaultConfigPath()
{
    const QString home = homePath();
    if (home.isEmpty()) {
        return QStringLiteral("updwatch.json");
    }
    return home + QStringLiteral("/.config/updwatch/updwatch.json");
}

QString defaultStateDirectory()
{
    const QString home = homePath();
    if (home.isEmpty()) {
        return QStringLiteral(".local/share/updwatch/state");
    }
    return home + QStringLiteral("/.local/share/updwatch/state");
}

StepResult<AppConfig> loadConfigFile(const QString &path)
{
    QFile file(path);
    if (!file.exists()) {
        return StepResult<AppConfig>::err(
            ErrorKind::ConfigInvalidValue,
            QStringLiteral("config file not found: %1").arg(path));
    }
    if (!file.open(QIODevice::ReadOnly)) {
        return StepResult<AppConfig>::err(
            ErrorKind::ConfigInvalidValue,
            QStringLiteral("cannot read config file %1: %2").arg(path, file.errorString()));
    }

    const QByteArray data = file.readAll();
    nlohmann::json root;
    try {
        root = nlohmann::json::parse(data.toStdString());
    } catch (const nlohmann::json::parse_error &ex) {
        return StepResult<AppConfig>::err(
            ErrorKind::ConfigInvalidValue,
            QStringLiteral("config file %1 is not valid JSON: %2")
                .arg(path, QString::fromUtf8(ex.what())));
    }

    return parseConfigJson(root);
}

StepResult<AppConfig> parseConfigJson(const nlohmann::json &root)
{
    if (!root.is_object()) {
        return StepResult<AppConfig>::err(ErrorKind::ConfigInvalidValue,
                                          QStringLiteral("config root must be an object"));
    }

    AppConfig config;
    config.stateDirectory = defaultStateDirectory();

    std::optional<StepError> error;
    if ((error = readString(root, "", "serverName", config.serverName))
        || (error = readString(root, "", "logsDirectory", config.logsDirectory))
        || (error = readString(root, "", "primaryLog", config.primaryLog))
        || (error = readString(root, "", "updateLogPattern", config.updateLogPattern))
        || (error = readString(root, "", "stateDirectory", config.stateDirectory))
        || (error = readString(root, "", "encoding", config.detection.encoding))
        || (error = readInt(root, "", "lockTimeoutMs", config.lockTimeoutMs))) {
        return StepResult<AppConfig>::err(*error);
    }

    if (auto it = root.find("detection"); it != root.end() && !it->is_null()) {
        if (!it->is_object()) {
            return StepResult<AppConfig>::err(
                ErrorKind::ConfigInvalidValue,
                QStringLiteral("config key 'detection' must be an object"));
        }
        const auto &detection = *it;
        if ((error = readString(detection, "detection", "packagePrefix",
                                config.detection.packagePrefix))
            || (error = readString(detection, "detection", "triggerKeyword",
                                   config.detection.triggerKeyword))
            || (error = readString(detection, "detection", "startMarker",
                                   config.detection.startMarker))
            || (error = readString(detection, "detection", "completionMarker",
                                   config.detection.completionMarker))
            || (error = readString(detection, "detection", "versionPhrase",
                                   config.detection.versionPhrase))) {
            return StepResult<AppConfig>::err(*error);
        }
    }

    if (auto it = root.find("notification"); it != root.end() && !it->is_null()) {
        if (!it->is_object()) {
            return StepResult<AppConfig>::err(
                ErrorKind::ConfigInvalidValue,
                QStringLiteral("config key 'notification' must be an object"));
        }
        const auto &notification = *it;
        if ((error = readBool(notification, "notification", "enabled",
                              config.notification.enabled))
            || (error = readString(notification, "notification", "apiUrl",
                                   config.notification.apiUrl))
            || (error = readString(notification, "notification", "botToken",
                                   config.notification.botToken))
            || (error = readString(notification, "notification", "chatId",
                                   config.notification.chatId))
            || (error = readInt(notification, "notification", "timeoutMs",
                                config.notification.timeoutMs))) {
            return StepResult<AppConfig>::err(*error);
        }
    }

    // Credentials may be kept out of the config file.
    if (config.notification.botToken.isEmpty()) {
        config.notification.botToken = qEnvironmentVariable("UPDWATCH_BOT_TOKEN");
    }

    return StepResult<AppConfig>::ok(config);
}

StepResult<void> validateConfig(const AppConfig &config)
{
    if (config.serverName.trimmed().isEmpty()) {
        return StepResult<void>::err(ErrorKind::ConfigMissingKey,
                                     QStringLiteral("config key 'serverName' is missing"));
    }
    if (config.logsDirectory.trimmed().isEmpty()) {
        return StepResult<void>::err(ErrorKind::ConfigMissingKey,
                                     QStringLiteral("config key 'logsDirectory' is missing"));
    }
    if (config.primaryLog.trimmed().isEmpty()) {
        return StepResult<void>::err(ErrorKind::ConfigInvalidValue,
                                     QStringLiteral("config key 'primaryLog' is empty"));
    }
    if (!config.updateLogPattern.contains(QStringLiteral("{date}"))) {
        return StepResult<void>::err(
            ErrorKind::ConfigInvalidValue,
            QStringLiteral("config key 'updateLogPattern' must contain {date}: %1")
                .arg(config.updateLogPattern));
    }
    if (config.stateDirectory.trimmed().isEmpty()) {
        return StepResult<void>::err(ErrorKind::ConfigInvalidValue,
                                     QStringLiteral("config key 'stateDirectory' is empty"));
    }
    if (config.lockTimeoutMs < 0) {
        return StepResult<void>::err(ErrorKind::ConfigInvalidValue,
                                     QStringLiteral("config key 'lockTimeoutMs' must not be negative"));
    }

    const DetectionConfig &detection = config.detection;
    if (!isKnownEncoding(detection.encoding)) {
        return StepResult<void>::err(
            ErrorKind::ConfigInvalidValue,
            QStringLiteral("config key 'encoding' names an unsupported encoding: %1")
                .arg(detection.encoding));
    }
    if (detection.packagePrefix.isEmpty() || detection.startMarker.isEmpty()
        || detection.completionMarker.isEmpty() || detection.versionPhrase.isEmpty()) {
        return StepResult<void>::err(ErrorKind::ConfigInvalidValue,
                                     QStringLiteral("detection markers must not be empty"));
    }

    const NotificationConfig &notification = config.notification;
    if (notification.enabled) {
        if (notification.botToken.isEmpty()) {
            return StepResult<void>::err(
                ErrorKind::ConfigMissingKey,
                QStringLiteral("config key 'notification.botToken' is missing"));
        }
        if (notification.chatId.isEmpty()) {
            return StepResult<void>::err(
                ErrorKind::ConfigMissingKey,
                QStringLiteral("config key 'notification.chatId' is missing"));
        }
        if (notification.apiUrl.isEmpty()) {
            return StepResult<void>::err(
                ErrorKind::ConfigInvalidValue,
                QStringLiteral("config key 'notification.apiUrl' is empty"));
        }
        if (notification.timeoutMs <= 0) {
            return StepResult<void>::err(
                ErrorKind::ConfigInvalidValue,
                QStringLiteral("config key 'notification.timeoutMs' must be positive"));
        }
    }

    return StepResult<void>::ok();
}

QString sanitizeServerName(const QString &serverName)
{
    static const QRegularExpression disallowed(QStringLiteral("[^A-Za-z0-9-]"));
    QString sanitized = serverName;
    sanitized.replace(disallowed, QStringLiteral("_"));
    return sanitized;
}

QString checkpointPathFor(const AppConfig &config)
{
    return QDir(config.stateDirectory)
        .filePath(QStringLiteral("last_check_%1.txt").arg(sanitizeServerName(config.serverName)));
}

QString primaryLogPathFor(const AppConfig &config)
{
    return resolveAgainst(config.logsDirectory, config.primaryLog);
}

QString updateLogPathFor(const AppConfig &config, const QDate &date)
{
    QString name = config.updateLogPattern;
    name.replace(QStringLiteral("{date}"), date.toString(QStringLiteral("yyyy-MM-dd")));
    return resolveAgainst(config.logsDirectory, name);
}

} // namespace updwatch
