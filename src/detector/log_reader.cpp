#include "detector/log_reader.hpp"

#include <QFile>
#include <QFileInfo>
#include <QStringDecoder>

#include "common/logging.hpp"

namespace updwatch {

StepResult<QString> readLogText(const QString &path,
                                const QString &encoding,
                                ErrorKind missingKind)
{
    QFileInfo info(path);
    if (!info.exists() || !info.isFile()) {
        return StepResult<QString>::err(missingKind,
                                        QStringLiteral("log file not found: %1").arg(path));
    }

    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        return StepResult<QString>::err(
            ErrorKind::EncodingReadError,
            QStringLiteral("cannot read log file %1: %2").arg(path, file.errorString()));
    }
    const QByteArray data = file.readAll();

    const QByteArray encodingName = encoding.toUtf8();
    QStringDecoder decoder(encodingName.constData());
    if (!decoder.isValid()) {
        return StepResult<QString>::err(
            ErrorKind::EncodingReadError,
            QStringLiteral("unsupported encoding %1 for %2").arg(encoding, path));
    }

    QString text = decoder.decode(data);
    if (decoder.hasError()) {
        return StepResult<QString>::err(
            ErrorKind::EncodingReadError,
            QStringLiteral("log file %1 is not valid %2 text").arg(path, encoding));
    }

    UWLOG_DEBUG(QStringLiteral("LogReader"),
                QStringLiteral("log_read"),
                (nlohmann::json{{"path", path.toStdString()},
                                {"bytes", data.size()},
                                {"encoding", encoding.toStdString()}}));
    return StepResult<QString>::ok(text);
}

QStringList splitLogLines(const QString &text)
{
    QStringList lines = text.split(QLatin1Char('\n'), Qt::SkipEmptyParts);
    QStringList result;
    result.reserve(lines.size());
    for (QString &line : lines) {
        if (line.endsWith(QLatin1Char('\r'))) {
            line.chop(1);
        }
        if (!line.isEmpty()) {
            result.push_back(line);
        }
    }
    return result;
}

} // namespace updwatch
