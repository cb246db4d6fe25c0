#pragma once

#include <QString>

namespace updwatch {

struct NotifyResult {
    bool ok = false;
    QString error;
};

// Outbound chat notification transport.
class Notifier
{
public:
    virtual ~Notifier() = default;

    virtual NotifyResult send(const QString &text) = 0;
};

} // namespace updwatch
