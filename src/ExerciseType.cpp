// ExerciseType.cpp
// Required joint table per exercise.

#include "ExerciseType.h"

#include <array>

namespace {

using J = JointName;

const std::vector<JointName> SQUAT_JOINTS = {
    J::LeftHip, J::RightHip, J::LeftKnee, J::RightKnee, J::LeftAnkle, J::RightAnkle,
    J::LeftShoulder, J::RightShoulder, J::Neck
};

const std::vector<JointName> DEADLIFT_JOINTS = {
    J::LeftHip, J::RightHip, J::LeftKnee, J::RightKnee, J::LeftAnkle, J::RightAnkle,
    J::LeftShoulder, J::RightShoulder, J::LeftWrist, J::RightWrist, J::Neck
};

const std::vector<JointName> BENCH_PRESS_JOINTS = {
    J::LeftShoulder, J::RightShoulder, J::LeftElbow, J::RightElbow,
    J::LeftWrist, J::RightWrist, J::Neck
};

// Shoulder press and pull-up share the same upper body + hips set
const std::vector<JointName> OVERHEAD_JOINTS = {
    J::LeftShoulder, J::RightShoulder, J::LeftElbow, J::RightElbow,
    J::LeftWrist, J::RightWrist, J::Neck, J::LeftHip, J::RightHip
};

const std::vector<JointName> FULL_BODY_JOINTS = {
    J::Nose, J::LeftEye, J::RightEye, J::LeftEar, J::RightEar,
    J::Neck, J::LeftShoulder, J::RightShoulder, J::LeftElbow, J::RightElbow,
    J::LeftWrist, J::RightWrist, J::LeftHip, J::RightHip, J::LeftKnee, J::RightKnee,
    J::LeftAnkle, J::RightAnkle, J::Root
};

const std::array<ExerciseType, 6> ALL_TYPES = {
    ExerciseType::Squat, ExerciseType::Deadlift, ExerciseType::BenchPress,
    ExerciseType::ShoulderPress, ExerciseType::PullUp, ExerciseType::Unknown
};

} // namespace

const std::vector<JointName>& requiredJoints(ExerciseType type)
{
    switch (type) {
    case ExerciseType::Squat:         return SQUAT_JOINTS;
    case ExerciseType::Deadlift:      return DEADLIFT_JOINTS;
    case ExerciseType::BenchPress:    return BENCH_PRESS_JOINTS;
    case ExerciseType::ShoulderPress: return OVERHEAD_JOINTS;
    case ExerciseType::PullUp:        return OVERHEAD_JOINTS;
    case ExerciseType::Unknown:       return FULL_BODY_JOINTS;
    }
    return FULL_BODY_JOINTS;
}

const char* toString(ExerciseType type)
{
    switch (type) {
    case ExerciseType::Squat:         return "squat";
    case ExerciseType::Deadlift:      return "deadlift";
    case ExerciseType::BenchPress:    return "benchPress";
    case ExerciseType::ShoulderPress: return "shoulderPress";
    case ExerciseType::PullUp:        return "pullUp";
    case ExerciseType::Unknown:       return "unknown";
    }
    return "unknown";
}

const char* displayName(ExerciseType type)
{
    switch (type) {
    case ExerciseType::Squat:         return "Squat";
    case ExerciseType::Deadlift:      return "Deadlift";
    case ExerciseType::BenchPress:    return "Bench Press";
    case ExerciseType::ShoulderPress: return "Shoulder Press";
    case ExerciseType::PullUp:        return "Pull Up";
    case ExerciseType::Unknown:       return "Unknown";
    }
    return "Unknown";
}

std::optional<ExerciseType> parseExerciseType(const std::string& text)
{
    for (ExerciseType type : ALL_TYPES) {
        if (text == toString(type))
            return type;
    }
    return std::nullopt;
}
