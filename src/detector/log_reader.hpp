#pragma once

#include <QString>
#include <QStringList>

#include "common/errors.hpp"

namespace updwatch {

// Reads the whole file and decodes it with the named encoding.
// A missing file yields missingKind; read or decoding failures yield EncodingReadError.
StepResult<QString> readLogText(const QString &path,
                                const QString &encoding,
                                ErrorKind missingKind);

// Splits on '\n', strips a trailing '\r' and drops empty lines.
QStringList splitLogLines(const QString &text);

} // namespace updwatch
