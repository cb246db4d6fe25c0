#pragma once

#include <QString>

#include "common/enums.hpp"

namespace updwatch {

// Structured audit trail for operators. Writes are best-effort: a false return
// is logged as a warning and never changes the run outcome.
class AuditSink
{
public:
    virtual ~AuditSink() = default;

    virtual bool write(const QString &text, AuditSeverity severity, EventId eventId) = 0;
};

// Integer event id used on the audit wire: blocks of 100 per category.
int wireEventId(EventId eventId);
QString toAuditSeverityString(AuditSeverity severity);

} // namespace updwatch
