// BodyJoint
// ----------
// Joint vocabulary shared by the pose detector, the quality scorer and
// the keypoint files.
//  - JointName: the 19 landmarks we know about. The first 14 are the
//    tracked joints stored in a PoseEstimate (nose occupies the head slot).
//    Eyes, ears and root are only ever referenced by the "unknown"
//    exercise's required set.
//  - BodyJoint: one detected landmark in image pixel space.

#pragma once

#include <opencv2/core.hpp>

#include <array>
#include <cstddef>
#include <optional>
#include <string>

enum class JointName
{
    Nose = 0,
    Neck,
    LeftShoulder,
    RightShoulder,
    LeftElbow,
    RightElbow,
    LeftWrist,
    RightWrist,
    LeftHip,
    RightHip,
    LeftKnee,
    RightKnee,
    LeftAnkle,
    RightAnkle,
    // vocabulary-only landmarks
    LeftEye,
    RightEye,
    LeftEar,
    RightEar,
    Root
};

constexpr std::size_t kNumTrackedJoints = 14;
constexpr std::size_t kNumJointNames = 19;

// Per-point confidence a detection must exceed to be stored at all
constexpr float kJointAcceptanceThreshold = 0.3f;

// Per-point confidence a stored joint must exceed to count as valid
constexpr float kJointValidThreshold = 0.5f;

// Tracked joints in slot order
extern const std::array<JointName, kNumTrackedJoints> kTrackedJoints;

inline std::size_t jointIndex(JointName name) { return static_cast<std::size_t>(name); }
inline bool isTrackedJoint(JointName name) { return jointIndex(name) < kNumTrackedJoints; }

// camelCase form used in logs and JSON ("leftKnee")
const char* toString(JointName name);
std::optional<JointName> parseJointName(const std::string& text);

struct BodyJoint
{
    cv::Point2f position;   // pixels, origin top-left
    float confidence = 0.0f;
    JointName name = JointName::Nose;
};
