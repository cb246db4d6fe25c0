#pragma once

#include <optional>

#include <QDateTime>
#include <QString>

#include "common/errors.hpp"

namespace updwatch {

// Single-timestamp checkpoint persisted as one "DD.MM.YYYY HH:MM:SS" line.
class CheckpointStore
{
public:
    explicit CheckpointStore(QString path);

    const QString &path() const { return m_path; }

    // Missing or unparsable files read as "no checkpoint" so the next scan is full.
    std::optional<QDateTime> read() const;

    // Creates the parent directory first. Failures are reported, never thrown.
    StepResult<void> ensureDirectory() const;
    StepResult<void> write(const QDateTime &timestamp) const;

private:
    QString m_path;
};

} // namespace updwatch
