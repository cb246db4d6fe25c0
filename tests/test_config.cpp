#include <QtTest/QtTest>

#include <QFile>
#include <QTemporaryDir>

#include <nlohmann/json.hpp>

#include "common/config.hpp"

class ConfigTests : public QObject
{
    Q_OBJECT
private slots:
    void initTestCase();
    void cleanupTestCase();
    void testDefaultsApplied();
    void testNestedSectionsParsed();
    void testWrongTypeRejected();
    void testOutOfRangeIntegerRejected();
    void testMissingFileRejected();
    void testInvalidJsonRejected();
    void testMissingServerName();
    void testMissingLogsDirectory();
    void testPatternWithoutDate();
    void testUnknownEncoding();
    void testNotificationCredentialsRequired();
    void testBotTokenFromEnvironment();
    void testSanitizeServerName();
    void testDerivedPaths();

private:
    updwatch::AppConfig validConfig() const;

    QTemporaryDir m_tempDir;
    QByteArray m_prevHome;
};

updwatch::AppConfig ConfigTests::validConfig() const
{
    updwatch::AppConfig config;
    config.serverName = QStringLiteral("srv-01");
    config.logsDirectory = m_tempDir.filePath("logs");
    config.stateDirectory = m_tempDir.filePath("state");
    return config;
}

void ConfigTests::initTestCase()
{
    QVERIFY(m_tempDir.isValid());
    m_prevHome = qgetenv("HOME");
    qputenv("HOME", m_tempDir.path().toUtf8());
    qunsetenv("UPDWATCH_BOT_TOKEN");
}

void ConfigTests::cleanupTestCase()
{
    if (m_prevHome.isEmpty()) {
        qunsetenv("HOME");
    } else {
        qputenv("HOME", m_prevHome);
    }
}

void ConfigTests::testDefaultsApplied()
{
    const auto result = updwatch::parseConfigJson(
        nlohmann::json{{"serverName", "srv-01"}, {"logsDirectory", "/var/log/ezvit"}});
    QVERIFY(result.isOk());

    const auto &config = result.value();
    QCOMPARE(config.primaryLog, QStringLiteral("ezvit.log"));
    QCOMPARE(config.updateLogPattern, QStringLiteral("update_{date}.log"));
    QCOMPARE(config.stateDirectory, m_tempDir.path() + "/.local/share/updwatch/state");
    QCOMPARE(config.detection.encoding, QStringLiteral("UTF-8"));
    QCOMPARE(config.detection.startMarker, QStringLiteral("Update operation started"));
    QVERIFY(!config.notification.enabled);
    QVERIFY(updwatch::validateConfig(config).isOk());
}

void ConfigTests::testNestedSectionsParsed()
{
    const nlohmann::json root = {
        {"serverName", "srv-01"},
        {"logsDirectory", "/var/log/ezvit"},
        {"encoding", "windows-1251"},
        {"lockTimeoutMs", 500},
        {"detection", {{"packagePrefix", "acme"}, {"triggerKeyword", "Download started"}}},
        {"notification", {{"enabled", true}, {"botToken", "123:abc"}, {"chatId", "-100"},
                          {"timeoutMs", 2000}}}
    };

    const auto result = updwatch::parseConfigJson(root);
    QVERIFY(result.isOk());
    const auto &config = result.value();
    QCOMPARE(config.detection.encoding, QStringLiteral("windows-1251"));
    QCOMPARE(config.lockTimeoutMs, 500);
    QCOMPARE(config.detection.packagePrefix, QStringLiteral("acme"));
    QCOMPARE(config.detection.triggerKeyword, QStringLiteral("Download started"));
    QVERIFY(config.notification.enabled);
    QCOMPARE(config.notification.botToken, QStringLiteral("123:abc"));
    QCOMPARE(config.notification.chatId, QStringLiteral("-100"));
    QCOMPARE(config.notification.timeoutMs, 2000);
}

void ConfigTests::testWrongTypeRejected()
{
    const auto result = updwatch::parseConfigJson(
        nlohmann::json{{"serverName", 42}, {"logsDirectory", "/var/log/ezvit"}});
    QVERIFY(!result.isOk());
    QCOMPARE(result.error().kind, updwatch::ErrorKind::ConfigInvalidValue);
    QVERIFY(result.error().message.contains("serverName"));

    const auto nested = updwatch::parseConfigJson(
        nlohmann::json{{"serverName", "srv"}, {"notification", {{"enabled", "yes"}}}});
    QVERIFY(!nested.isOk());
    QVERIFY(nested.error().message.contains("notification.enabled"));

    QVERIFY(!updwatch::parseConfigJson(nlohmann::json::array()).isOk());
}

void ConfigTests::testOutOfRangeIntegerRejected()
{
    const auto tooLarge = updwatch::parseConfigJson(
        nlohmann::json{{"serverName", "srv"},
                       {"logsDirectory", "/tmp"},
                       {"lockTimeoutMs", 4294967296LL}});
    QVERIFY(!tooLarge.isOk());
    QCOMPARE(tooLarge.error().kind, updwatch::ErrorKind::ConfigInvalidValue);
    QVERIFY(tooLarge.error().message.contains("lockTimeoutMs"));

    const auto tooSmall = updwatch::parseConfigJson(
        nlohmann::json{{"serverName", "srv"},
                       {"logsDirectory", "/tmp"},
                       {"notification", {{"timeoutMs", -4294967296LL}}}});
    QVERIFY(!tooSmall.isOk());
    QVERIFY(tooSmall.error().message.contains("notification.timeoutMs"));

    const auto fits = updwatch::parseConfigJson(
        nlohmann::json{{"serverName", "srv"},
                       {"logsDirectory", "/tmp"},
                       {"lockTimeoutMs", 2147483647LL}});
    QVERIFY(fits.isOk());
    QCOMPARE(fits.value().lockTimeoutMs, 2147483647);
}

void ConfigTests::testMissingFileRejected()
{
    const auto result = updwatch::loadConfigFile(m_tempDir.filePath("absent.json"));
    QVERIFY(!result.isOk());
    QCOMPARE(result.error().kind, updwatch::ErrorKind::ConfigInvalidValue);
}

void ConfigTests::testInvalidJsonRejected()
{
    const QString path = m_tempDir.filePath("broken.json");
    QFile file(path);
    QVERIFY(file.open(QIODevice::WriteOnly));
    file.write("{\"serverName\": ");
    file.close();

    const auto result = updwatch::loadConfigFile(path);
    QVERIFY(!result.isOk());
    QCOMPARE(result.error().kind, updwatch::ErrorKind::ConfigInvalidValue);
}

void ConfigTests::testMissingServerName()
{
    auto config = validConfig();
    config.serverName = QStringLiteral("  ");
    const auto result = updwatch::validateConfig(config);
    QVERIFY(!result.isOk());
    QCOMPARE(result.error().kind, updwatch::ErrorKind::ConfigMissingKey);
}

void ConfigTests::testMissingLogsDirectory()
{
    auto config = validConfig();
    config.logsDirectory.clear();
    const auto result = updwatch::validateConfig(config);
    QVERIFY(!result.isOk());
    QCOMPARE(result.error().kind, updwatch::ErrorKind::ConfigMissingKey);
}

void ConfigTests::testPatternWithoutDate()
{
    auto config = validConfig();
    config.updateLogPattern = QStringLiteral("update.log");
    const auto result = updwatch::validateConfig(config);
    QVERIFY(!result.isOk());
    QCOMPARE(result.error().kind, updwatch::ErrorKind::ConfigInvalidValue);
}

void ConfigTests::testUnknownEncoding()
{
    auto config = validConfig();
    config.detection.encoding = QStringLiteral("no-such-encoding");
    const auto result = updwatch::validateConfig(config);
    QVERIFY(!result.isOk());
    QCOMPARE(result.error().kind, updwatch::ErrorKind::ConfigInvalidValue);
}

void ConfigTests::testNotificationCredentialsRequired()
{
    auto config = validConfig();
    config.notification.enabled = true;
    config.notification.chatId = QStringLiteral("-100");
    auto result = updwatch::validateConfig(config);
    QVERIFY(!result.isOk());
    QCOMPARE(result.error().kind, updwatch::ErrorKind::ConfigMissingKey);
    QVERIFY(result.error().message.contains("botToken"));

    config.notification.botToken = QStringLiteral("123:abc");
    QVERIFY(updwatch::validateConfig(config).isOk());

    config.notification.chatId.clear();
    result = updwatch::validateConfig(config);
    QVERIFY(!result.isOk());
    QVERIFY(result.error().message.contains("chatId"));
}

void ConfigTests::testBotTokenFromEnvironment()
{
    qputenv("UPDWATCH_BOT_TOKEN", "987:env");
    const auto result = updwatch::parseConfigJson(
        nlohmann::json{{"serverName", "srv"}, {"logsDirectory", "/tmp"}});
    qunsetenv("UPDWATCH_BOT_TOKEN");

    QVERIFY(result.isOk());
    QCOMPARE(result.value().notification.botToken, QStringLiteral("987:env"));
}

void ConfigTests::testSanitizeServerName()
{
    QCOMPARE(updwatch::sanitizeServerName("srv-01"), QStringLiteral("srv-01"));
    QCOMPARE(updwatch::sanitizeServerName("Pharmacy #3/Main"), QStringLiteral("Pharmacy__3_Main"));
    QCOMPARE(updwatch::sanitizeServerName("a.b c"), QStringLiteral("a_b_c"));
}

void ConfigTests::testDerivedPaths()
{
    updwatch::AppConfig config;
    config.serverName = QStringLiteral("Main Server");
    config.logsDirectory = QStringLiteral("/var/log/ezvit");
    config.stateDirectory = QStringLiteral("/var/lib/updwatch");

    QCOMPARE(updwatch::checkpointPathFor(config),
             QStringLiteral("/var/lib/updwatch/last_check_Main_Server.txt"));
    QCOMPARE(updwatch::primaryLogPathFor(config), QStringLiteral("/var/log/ezvit/ezvit.log"));
    QCOMPARE(updwatch::updateLogPathFor(config, QDate(2025, 10, 23)),
             QStringLiteral("/var/log/ezvit/update_2025-10-23.log"));
}

QTEST_MAIN(ConfigTests)
#include "test_config.moc"
