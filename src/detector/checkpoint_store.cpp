#include "detector/checkpoint_store.hpp"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QSaveFile>

#include "common/logging.hpp"
#include "detector/timestamp_parser.hpp"

namespace updwatch {

CheckpointStore::CheckpointStore(QString path)
    : m_path(std::move(path))
{
}

std::optional<QDateTime> CheckpointStore::read() const
{
    QFile file(m_path);
    if (!file.exists()) {
        return std::nullopt;
    }
    if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) {
        UWLOG_WARN(QStringLiteral("CheckpointStore"),
                   QStringLiteral("checkpoint_unreadable"),
                   (nlohmann::json{{"path", m_path.toStdString()},
                                   {"error", file.errorString().toStdString()}}));
        return std::nullopt;
    }

    const QString content = QString::fromUtf8(file.readAll());
    const auto timestamp = parseCheckpointTimestamp(content);
    if (!timestamp.has_value()) {
        UWLOG_WARN(QStringLiteral("CheckpointStore"),
                   QStringLiteral("checkpoint_unparsable"),
                   (nlohmann::json{{"path", m_path.toStdString()},
                                   {"content", content.left(64).toStdString()}}));
    }
    return timestamp;
}

StepResult<void> CheckpointStore::ensureDirectory() const
{
    const QString dirPath = QFileInfo(m_path).absolutePath();
    if (QFileInfo(dirPath).isDir()) {
        return StepResult<void>::ok();
    }
    if (!QDir().mkpath(dirPath)) {
        return StepResult<void>::err(
            ErrorKind::CheckpointDirectoryCreationFailed,
            QStringLiteral("cannot create checkpoint directory %1").arg(dirPath));
    }
    return StepResult<void>::ok();
}

StepResult<void> CheckpointStore::write(const QDateTime &timestamp) const
{
    const auto dirResult = ensureDirectory();
    if (!dirResult.isOk()) {
        return dirResult;
    }

    // Replaced atomically; readers never see a partial line.
    QSaveFile file(m_path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Text)) {
        return StepResult<void>::err(
            ErrorKind::CheckpointWriteError,
            QStringLiteral("cannot open checkpoint %1: %2").arg(m_path, file.errorString()));
    }

    const QByteArray data = formatCheckpointTimestamp(timestamp).toUtf8() + '\n';
    if (file.write(data) != data.size() || !file.commit()) {
        return StepResult<void>::err(
            ErrorKind::CheckpointWriteError,
            QStringLiteral("cannot write checkpoint %1: %2").arg(m_path, file.errorString()));
    }
    return StepResult<void>::ok();
}

} // namespace updwatch
