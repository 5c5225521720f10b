#include "ExerciseType.h"

#include <gtest/gtest.h>

#include <algorithm>

using J = JointName;

TEST(ExerciseType, SquatRequiredJoints)
{
    const std::vector<JointName> expected = {
        J::LeftHip, J::RightHip, J::LeftKnee, J::RightKnee, J::LeftAnkle, J::RightAnkle,
        J::LeftShoulder, J::RightShoulder, J::Neck
    };
    EXPECT_EQ(requiredJoints(ExerciseType::Squat), expected);
}

TEST(ExerciseType, DeadliftAddsWrists)
{
    const std::vector<JointName> expected = {
        J::LeftHip, J::RightHip, J::LeftKnee, J::RightKnee, J::LeftAnkle, J::RightAnkle,
        J::LeftShoulder, J::RightShoulder, J::LeftWrist, J::RightWrist, J::Neck
    };
    EXPECT_EQ(requiredJoints(ExerciseType::Deadlift), expected);
}

TEST(ExerciseType, BenchPressIsUpperBodyOnly)
{
    const std::vector<JointName> expected = {
        J::LeftShoulder, J::RightShoulder, J::LeftElbow, J::RightElbow,
        J::LeftWrist, J::RightWrist, J::Neck
    };
    EXPECT_EQ(requiredJoints(ExerciseType::BenchPress), expected);
}

TEST(ExerciseType, OverheadExercisesShareTheirJoints)
{
    const std::vector<JointName> expected = {
        J::LeftShoulder, J::RightShoulder, J::LeftElbow, J::RightElbow,
        J::LeftWrist, J::RightWrist, J::Neck, J::LeftHip, J::RightHip
    };
    EXPECT_EQ(requiredJoints(ExerciseType::ShoulderPress), expected);
    EXPECT_EQ(requiredJoints(ExerciseType::PullUp), expected);
}

TEST(ExerciseType, UnknownRequiresFullVocabulary)
{
    const auto& joints = requiredJoints(ExerciseType::Unknown);
    ASSERT_EQ(joints.size(), 19u);
    EXPECT_EQ(joints.front(), J::Nose);
    EXPECT_EQ(joints.back(), J::Root);

    for (std::size_t i = 0; i < kNumJointNames; ++i) {
        const auto name = static_cast<JointName>(i);
        EXPECT_NE(std::find(joints.begin(), joints.end(), name), joints.end()) << toString(name);
    }
}

TEST(ExerciseType, StringForms)
{
    EXPECT_STREQ(toString(ExerciseType::BenchPress), "benchPress");
    EXPECT_STREQ(displayName(ExerciseType::BenchPress), "Bench Press");
    EXPECT_STREQ(displayName(ExerciseType::PullUp), "Pull Up");

    EXPECT_EQ(parseExerciseType("shoulderPress"), ExerciseType::ShoulderPress);
    EXPECT_EQ(parseExerciseType("unknown"), ExerciseType::Unknown);
    EXPECT_FALSE(parseExerciseType("Squat").has_value());
    EXPECT_FALSE(parseExerciseType("lunge").has_value());
}
