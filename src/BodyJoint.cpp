// BodyJoint.cpp
// String conversions for the joint vocabulary.

#include "BodyJoint.h"

namespace {

const std::array<const char*, kNumJointNames> JOINT_NAMES = {
    "nose",
    "neck",
    "leftShoulder",
    "rightShoulder",
    "leftElbow",
    "rightElbow",
    "leftWrist",
    "rightWrist",
    "leftHip",
    "rightHip",
    "leftKnee",
    "rightKnee",
    "leftAnkle",
    "rightAnkle",
    "leftEye",
    "rightEye",
    "leftEar",
    "rightEar",
    "root"
};

} // namespace

const std::array<JointName, kNumTrackedJoints> kTrackedJoints = {
    JointName::Nose,
    JointName::Neck,
    JointName::LeftShoulder,
    JointName::RightShoulder,
    JointName::LeftElbow,
    JointName::RightElbow,
    JointName::LeftWrist,
    JointName::RightWrist,
    JointName::LeftHip,
    JointName::RightHip,
    JointName::LeftKnee,
    JointName::RightKnee,
    JointName::LeftAnkle,
    JointName::RightAnkle
};

const char* toString(JointName name)
{
    return JOINT_NAMES[jointIndex(name)];
}

std::optional<JointName> parseJointName(const std::string& text)
{
    for (std::size_t i = 0; i < JOINT_NAMES.size(); ++i) {
        if (text == JOINT_NAMES[i])
            return static_cast<JointName>(i);
    }
    // The head slot is called "head" by some callers
    if (text == "head")
        return JointName::Nose;
    return std::nullopt;
}
