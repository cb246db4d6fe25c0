#pragma once

#include <QString>

#include "common/config.hpp"
#include "common/models.hpp"

namespace updwatch {

// "<versionPhrase> - <targetToken>" with optional spaces around the hyphen and a
// word boundary after the token, so "187" does not match "1870".
bool hasVersionConfirmation(const QString &content,
                            const QString &targetToken,
                            const DetectionConfig &detection);

bool hasCompletionMarker(const QString &content, const DetectionConfig &detection);

MarkerResult validateMarkers(const QString &content,
                             const QString &targetToken,
                             const DetectionConfig &detection);

} // namespace updwatch
