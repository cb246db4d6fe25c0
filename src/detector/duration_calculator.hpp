#pragma once

#include <QStringList>

#include "common/models.hpp"

namespace updwatch {

// First and last timestamped update-log lines, in one forward pass. Lines
// without a timestamp prefix are ignored; with no timestamped line every
// field stays empty.
UpdateDuration computeUpdateDuration(const QStringList &lines);

} // namespace updwatch
