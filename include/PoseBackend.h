// PoseBackend
// ------------
// The body pose model behind PoseDetector.
// A backend reports at most one body per image, in the model's normalized
// coordinate space: both axes in [0, 1], origin at the BOTTOM-left.
// Implementations:
//  - OpenPoseBackend (live inference)
//  - PrecomputedPoseBackend (keypoints loaded from JSON)

#pragma once

#include "BodyJoint.h"

#include <opencv2/core.hpp>

#include <array>
#include <optional>

struct RecognizedPoint
{
    float x = 0.0f;
    float y = 0.0f;
    float confidence = 0.0f;
};

struct PoseObservation
{
    // Indexed by jointIndex(JointName); empty if the model did not report it
    std::array<std::optional<RecognizedPoint>, kNumJointNames> points;
    float confidence = 0.0f;

    const std::optional<RecognizedPoint>& point(JointName name) const { return points[jointIndex(name)]; }
    void setPoint(JointName name, const RecognizedPoint& p) { points[jointIndex(name)] = p; }
};

class PoseBackend
{
public:
    virtual ~PoseBackend() = default;

    // frameIdx is the image's position in the sampled frame list.
    // Empty when no body was found. May throw on model failure.
    virtual std::optional<PoseObservation> detect(const cv::Mat& image, int frameIdx) = 0;
};
