#include "detector/marker_validator.hpp"

#include <QRegularExpression>

namespace updwatch {

bool hasVersionConfirmation(const QString &content,
                            const QString &targetToken,
                            const DetectionConfig &detection)
{
    if (targetToken.isEmpty()) {
        return false;
    }

    const QRegularExpression pattern(
        QRegularExpression::escape(detection.versionPhrase)
            + QStringLiteral(R"(\s*-\s*)")
            + QRegularExpression::escape(targetToken)
            + QStringLiteral(R"(\b)"),
        QRegularExpression::CaseInsensitiveOption);
    return pattern.match(content).hasMatch();
}

bool hasCompletionMarker(const QString &content, const DetectionConfig &detection)
{
    return content.contains(detection.completionMarker);
}

MarkerResult validateMarkers(const QString &content,
                             const QString &targetToken,
                             const DetectionConfig &detection)
{
    MarkerResult result;
    result.versionConfirmed = hasVersionConfirmation(content, targetToken, detection);
    result.completionConfirmed = hasCompletionMarker(content, detection);
    return result;
}

} // namespace updwatch
