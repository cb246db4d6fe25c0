#pragma once

#include <QString>

#include "common/config.hpp"
#include "common/models.hpp"

namespace updwatch {

class StateClassifier
{
public:
    explicit StateClassifier(const DetectionConfig &detection);

    // Success iff the last operation block holds both the version confirmation
    // for targetToken and the completion marker.
    ClassificationResult classify(const QString &updateLogText, const QString &targetToken) const;

    // Same verdict for an already located block.
    ClassificationResult classifyBlock(const OperationBlock &block,
                                       const QString &targetToken) const;

private:
    DetectionConfig m_detection;
};

} // namespace updwatch
