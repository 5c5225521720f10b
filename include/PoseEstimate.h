// PoseEstimate
// -------------
// One frame's body pose: 14 optional joint slots indexed by JointName,
// plus the detector's whole-pose confidence.
// Produced by:
//  - PoseDetector (frameIndex = 0, timestamp = now)
// Updated by:
//  - PoseSequenceBuilder, which back-fills frameIndex and timestamp
// Read by:
//  - QualityScorer, PoseExport

#pragma once

#include "BodyJoint.h"

#include <array>
#include <chrono>
#include <optional>
#include <string>
#include <vector>

class PoseEstimate
{
public:
    using Clock = std::chrono::system_clock;
    using JointSlots = std::array<std::optional<BodyJoint>, kNumTrackedJoints>;

    // Throws PoseDetectionError(InvalidPoseData) if a slot holds a joint
    // at or below the acceptance threshold, or a joint stored under the
    // wrong slot.
    PoseEstimate(const JointSlots& joints, float overallConfidence);

    const std::string& id() const { return id_; }

    int frameIndex() const { return frameIndex_; }
    Clock::time_point timestamp() const { return timestamp_; }
    void setFrameIndex(int frameIndex) { frameIndex_ = frameIndex; }
    void setTimestamp(Clock::time_point timestamp) { timestamp_ = timestamp; }

    float overallConfidence() const { return overallConfidence_; }

    // Slot lookup; non-tracked names always yield an empty slot
    const std::optional<BodyJoint>& joint(JointName name) const;
    const JointSlots& joints() const { return joints_; }

    // Present joints, in slot order
    std::vector<BodyJoint> allJoints() const;

    // Present joints with confidence > kJointValidThreshold
    std::vector<BodyJoint> allValidJoints() const;

    // Mean position of allValidJoints(); empty if there are none
    std::optional<cv::Point2f> centerOfMass() const;

private:
    std::string id_;
    int frameIndex_ = 0;
    Clock::time_point timestamp_;
    JointSlots joints_;
    float overallConfidence_ = 0.0f;
};
