#pragma once

#include <memory>
#include <vector>

#include <QDateTime>
#include <QString>

#include "notify/audit_sink.hpp"

namespace updwatch {

struct AuditEntry {
    QString id;
    QDateTime timestamp;
    QString severity;
    int eventId = 0;
    QString message;
};

// Append-only audit journal in a SQLite database (table audit_log).
// The database and its directory are created on first write.
class SqliteAuditSink : public AuditSink
{
public:
    explicit SqliteAuditSink(QString dbPath);
    ~SqliteAuditSink() override;

    bool write(const QString &text, AuditSeverity severity, EventId eventId) override;

    // Newest first.
    std::vector<AuditEntry> recentEntries(int limit) const;

    const QString &databasePath() const { return m_dbPath; }

private:
    struct Impl;

    void openOrThrow() const;

    QString m_dbPath;
    std::unique_ptr<Impl> impl;
};

} // namespace updwatch
