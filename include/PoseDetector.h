// PoseDetector
// -------------
// Turns one backend observation into a PoseEstimate.
// Responsibilities:
//  - Call the pose backend once per image
//  - Drop points at or below the acceptance threshold (0.3)
//  - Convert normalized, bottom-left coordinates into image pixels
// Used by:
//  - PoseSequenceBuilder

#pragma once

#include "PoseBackend.h"
#include "PoseEstimate.h"

#include <opencv2/core.hpp>
#include <optional>

// Normalized (origin bottom-left) -> pixel (origin top-left)
cv::Point2f normalizedToImage(const cv::Point2f& normalized, const cv::Size& imageSize);

// Wraps a PoseBackend
// Input: OpenCV frame
// Output: pose with frameIndex 0 and timestamp "now", or nothing if no
//         body was found. The caller assigns the real index and time.
class PoseDetector {
public:
    explicit PoseDetector(PoseBackend& backend);

    // frameIdx is forwarded to the backend (position in the sampled list).
    // Throws PoseDetectionError:
    //  - RequestExecutionFailed if the image is empty or the backend throws
    //  - InvalidPoseData if the backend output is not finite
    std::optional<PoseEstimate> detect(const cv::Mat& frame, int frameIdx = 0);

private:
    PoseBackend& backend_;
};
