#pragma once

#include <memory>

#include <QString>

#include "common/config.hpp"
#include "notify/notifier.hpp"

class QNetworkAccessManager;

namespace updwatch {

// Sends messages through the Telegram Bot API sendMessage method.
// Blocks on a local event loop until the reply arrives or the timeout fires.
class TelegramNotifier : public Notifier
{
public:
    explicit TelegramNotifier(const NotificationConfig &config);
    ~TelegramNotifier() override;

    NotifyResult send(const QString &text) override;

private:
    NotificationConfig m_config;
    std::unique_ptr<QNetworkAccessManager> m_network;
};

} // namespace updwatch
