#pragma once

#include <QString>

#include "common/config.hpp"
#include "common/models.hpp"

namespace updwatch {

// Locate the last operation block: the last completion marker and the last start
// marker that precedes it. Content runs from the start marker through the end of
// the completion marker text.
OperationBlock locateLastOperation(const QString &logText, const DetectionConfig &detection);

} // namespace updwatch
