#include "detector/state_classifier.hpp"

#include <QStringList>

#include "common/logging.hpp"
#include "detector/marker_validator.hpp"
#include "detector/operation_locator.hpp"

namespace updwatch {

StateClassifier::StateClassifier(const DetectionConfig &detection)
    : m_detection(detection)
{
}

ClassificationResult StateClassifier::classify(const QString &updateLogText,
                                               const QString &targetToken) const
{
    return classifyBlock(locateLastOperation(updateLogText, m_detection), targetToken);
}

ClassificationResult StateClassifier::classifyBlock(const OperationBlock &block,
                                                    const QString &targetToken) const
{
    ClassificationResult result;

    if (!block.found) {
        result.status = ClassificationStatus::Failed;
        result.operationFound = false;
        result.reason = QStringLiteral("no update operation found");
        if (block.state == BlockState::EndWithoutStart) {
            result.reason += QStringLiteral(" (completion marker without a start marker)");
        }
        return result;
    }

    const MarkerResult markers = validateMarkers(block.content, targetToken, m_detection);
    result.operationFound = true;
    result.versionConfirmed = markers.versionConfirmed;
    result.completionConfirmed = markers.completionConfirmed;

    if (markers.versionConfirmed && markers.completionConfirmed) {
        result.status = ClassificationStatus::Success;
        result.reason = QStringLiteral("update confirmed: version %1 reported and operation completed")
                            .arg(targetToken);
        return result;
    }

    QStringList missing;
    if (!markers.versionConfirmed) {
        missing << QStringLiteral("version confirmation (%1 - %2)")
                       .arg(m_detection.versionPhrase, targetToken);
    }
    if (!markers.completionConfirmed) {
        missing << QStringLiteral("completion marker");
    }

    result.status = ClassificationStatus::Failed;
    result.reason = QStringLiteral("missing ") + missing.join(QStringLiteral(" and "));

    UWLOG_DEBUG(QStringLiteral("StateClassifier"),
                QStringLiteral("markers_missing"),
                (nlohmann::json{{"versionConfirmed", markers.versionConfirmed},
                                {"completionConfirmed", markers.completionConfirmed},
                                {"token", targetToken.toStdString()}}));
    return result;
}

} // namespace updwatch
