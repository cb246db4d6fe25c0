#include "detector/operation_locator.hpp"

#include "common/logging.hpp"

namespace updwatch {

OperationBlock locateLastOperation(const QString &logText, const DetectionConfig &detection)
{
    OperationBlock block;

    const qsizetype endIndex = logText.lastIndexOf(detection.completionMarker);
    if (endIndex < 0) {
        block.state = BlockState::NoEndMarker;
        return block;
    }
    block.endMarkerOffset = endIndex;

    // Only text before the completion marker may hold its start marker.
    const qsizetype startIndex = endIndex == 0
        ? -1
        : logText.left(endIndex).lastIndexOf(detection.startMarker);
    if (startIndex < 0) {
        block.state = BlockState::EndWithoutStart;
        UWLOG_WARN(QStringLiteral("OperationLocator"),
                   QStringLiteral("start_marker_missing"),
                   (nlohmann::json{{"endMarkerOffset", endIndex}}));
        return block;
    }

    block.startOffset = startIndex;
    block.endOffset = endIndex + detection.completionMarker.size();
    block.content = logText.mid(block.startOffset, block.endOffset - block.startOffset);
    block.found = true;
    block.state = BlockState::Found;
    return block;
}

} // namespace updwatch
