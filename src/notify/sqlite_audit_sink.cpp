#include "notify/sqlite_audit_sink.hpp"

#include <QDir>
#include <QFileInfo>
#include <QUuid>

#include <stdexcept>
#include <string>

#include <sqlite3.h>

#include "common/logging.hpp"

namespace updwatch {

namespace {

constexpr const char *kCreateAuditLogTable =
    "CREATE TABLE IF NOT EXISTS audit_log ("
    "    id TEXT PRIMARY KEY,"
    "    timestamp INTEGER NOT NULL,"
    "    severity TEXT NOT NULL,"
    "    event_id INTEGER NOT NULL,"
    "    message TEXT NOT NULL"
    ");";

class Statement {
public:
    Statement(sqlite3 *db, const char *sql)
    {
        if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
            throw std::runtime_error(std::string("sqlite prepare failed: ")
                                     + sqlite3_errmsg(db));
        }
    }

    ~Statement()
    {
        if (stmt) {
            sqlite3_finalize(stmt);
        }
    }

    sqlite3_stmt *get() const
    {
        return stmt;
    }

private:
    sqlite3_stmt *stmt = nullptr;
};

void execOrThrow(sqlite3 *db, const char *sql)
{
    char *error = nullptr;
    if (sqlite3_exec(db, sql, nullptr, nullptr, &error) != SQLITE_OK) {
        std::string message = error ? error : "sqlite exec failed";
        sqlite3_free(error);
        throw std::runtime_error(message);
    }
}

void bindText(sqlite3_stmt *stmt, int index, const QString &value)
{
    const QByteArray utf8 = value.toUtf8();
    sqlite3_bind_text(stmt, index, utf8.constData(), utf8.size(), SQLITE_TRANSIENT);
}

QString columnText(sqlite3_stmt *stmt, int index)
{
    const unsigned char *text = sqlite3_column_text(stmt, index);
    if (!text) {
        return QString();
    }
    return QString::fromUtf8(reinterpret_cast<const char *>(text));
}

} // namespace

struct SqliteAuditSink::Impl {
    sqlite3 *db = nullptr;

    ~Impl()
    {
        if (db) {
            sqlite3_close(db);
        }
    }
};

SqliteAuditSink::SqliteAuditSink(QString dbPath)
    : m_dbPath(std::move(dbPath))
    , impl(std::make_unique<Impl>())
{
}

SqliteAuditSink::~SqliteAuditSink() = default;

void SqliteAuditSink::openOrThrow() const
{
    if (impl->db) {
        return;
    }

    const QString dirPath = QFileInfo(m_dbPath).absolutePath();
    if (!QDir().mkpath(dirPath)) {
        throw std::runtime_error("cannot create audit directory " + dirPath.toStdString());
    }

    sqlite3 *db = nullptr;
    if (sqlite3_open(m_dbPath.toUtf8().constData(), &db) != SQLITE_OK) {
        const std::string message = db ? sqlite3_errmsg(db) : "sqlite open failed";
        sqlite3_close(db);
        throw std::runtime_error("failed to open audit database: " + message);
    }
    impl->db = db;
    execOrThrow(impl->db, kCreateAuditLogTable);
}

bool SqliteAuditSink::write(const QString &text, AuditSeverity severity, EventId eventId)
{
    try {
        openOrThrow();

        Statement stmt(impl->db,
                       "INSERT INTO audit_log (id, timestamp, severity, event_id, message) "
                       "VALUES (?, ?, ?, ?, ?);");
        bindText(stmt.get(), 1, QUuid::createUuid().toString(QUuid::WithoutBraces));
        sqlite3_bind_int64(stmt.get(), 2, QDateTime::currentSecsSinceEpoch());
        bindText(stmt.get(), 3, toAuditSeverityString(severity));
        sqlite3_bind_int(stmt.get(), 4, wireEventId(eventId));
        bindText(stmt.get(), 5, text);

        if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
            throw std::runtime_error(std::string("audit insert failed: ")
                                     + sqlite3_errmsg(impl->db));
        }
        return true;
    } catch (const std::exception &ex) {
        UWLOG_WARN(QStringLiteral("SqliteAuditSink"),
                   QStringLiteral("audit_write_failed"),
                   (nlohmann::json{{"path", m_dbPath.toStdString()},
                                   {"error", ex.what()},
                                   {"eventId", wireEventId(eventId)}}));
        return false;
    }
}

std::vector<AuditEntry> SqliteAuditSink::recentEntries(int limit) const
{
    std::vector<AuditEntry> entries;
    try {
        openOrThrow();

        Statement stmt(impl->db,
                       "SELECT id, timestamp, severity, event_id, message FROM audit_log "
                       "ORDER BY timestamp DESC, rowid DESC LIMIT ?;");
        sqlite3_bind_int(stmt.get(), 1, limit);

        while (sqlite3_step(stmt.get()) == SQLITE_ROW) {
            AuditEntry entry;
            entry.id = columnText(stmt.get(), 0);
            entry.timestamp = QDateTime::fromSecsSinceEpoch(sqlite3_column_int64(stmt.get(), 1));
            entry.severity = columnText(stmt.get(), 2);
            entry.eventId = sqlite3_column_int(stmt.get(), 3);
            entry.message = columnText(stmt.get(), 4);
            entries.push_back(std::move(entry));
        }
    } catch (const std::exception &ex) {
        UWLOG_WARN(QStringLiteral("SqliteAuditSink"),
                   QStringLiteral("audit_read_failed"),
                   (nlohmann::json{{"path", m_dbPath.toStdString()},
                                   {"error", ex.what()}}));
    }
    return entries;
}

} // namespace updwatch
