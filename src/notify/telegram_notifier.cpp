#include "notify/telegram_notifier.hpp"

#include <QEventLoop>
#include <QNetworkAccessManager>
#include <QNetworkReply>
#include <QNetworkRequest>
#include <QUrl>

#include <nlohmann/json.hpp>

#include "common/logging.hpp"

namespace updwatch {

namespace {

QUrl sendMessageUrl(const NotificationConfig &config)
{
    QString base = config.apiUrl;
    while (base.endsWith(QLatin1Char('/'))) {
        base.chop(1);
    }
    return QUrl(base + QStringLiteral("/bot") + config.botToken
                + QStringLiteral("/sendMessage"));
}

QString describeApiError(const QByteArray &body)
{
    try {
        const auto parsed = nlohmann::json::parse(body.toStdString());
        if (parsed.is_object() && parsed.contains("description")
            && parsed.at("description").is_string()) {
            return QString::fromStdString(parsed.at("description").get<std::string>());
        }
    } catch (const nlohmann::json::parse_error &) {
        // Not JSON; report the raw body below.
    }
    return QString::fromUtf8(body.left(200));
}

} // namespace

TelegramNotifier::TelegramNotifier(const NotificationConfig &config)
    : m_config(config)
    , m_network(std::make_unique<QNetworkAccessManager>())
{
}

TelegramNotifier::~TelegramNotifier() = default;

NotifyResult TelegramNotifier::send(const QString &text)
{
    NotifyResult result;

    const QUrl url = sendMessageUrl(m_config);
    if (!url.isValid()) {
        result.error = QStringLiteral("invalid notification api url: %1").arg(m_config.apiUrl);
        return result;
    }

    QNetworkRequest request(url);
    request.setHeader(QNetworkRequest::ContentTypeHeader, QStringLiteral("application/json"));
    request.setTransferTimeout(m_config.timeoutMs);

    const nlohmann::json payload = {
        {"chat_id", m_config.chatId.toStdString()},
        {"text", text.toStdString()},
        {"disable_web_page_preview", true}
    };

    UWLOG_DEBUG(QStringLiteral("TelegramNotifier"),
                QStringLiteral("notification_send"),
                (nlohmann::json{{"host", url.host().toStdString()},
                                {"chars", text.size()}}));

    QNetworkReply *reply = m_network->post(request, QByteArray::fromStdString(payload.dump()));
    QEventLoop loop;
    QObject::connect(reply, &QNetworkReply::finished, &loop, &QEventLoop::quit);
    if (!reply->isFinished()) {
        loop.exec();
    }

    const int status = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();
    const QByteArray body = reply->readAll();

    if (reply->error() == QNetworkReply::OperationCanceledError
        || reply->error() == QNetworkReply::TimeoutError) {
        result.error = QStringLiteral("notification request timed out after %1 ms")
                           .arg(m_config.timeoutMs);
    } else if (status != 0 && (status < 200 || status >= 300)) {
        result.error = QStringLiteral("notification service returned HTTP %1: %2")
                           .arg(status)
                           .arg(describeApiError(body));
    } else if (reply->error() != QNetworkReply::NoError) {
        result.error = QStringLiteral("notification transport error: %1")
                           .arg(reply->errorString());
    } else {
        result.ok = true;
    }

    reply->deleteLater();
    if (!m_config.botToken.isEmpty()) {
        result.error.replace(m_config.botToken, QStringLiteral("<token>"));
    }
    return result;
}

} // namespace updwatch
