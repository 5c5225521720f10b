#include "BodyJoint.h"

#include <gtest/gtest.h>

TEST(BodyJoint, TrackedJointsAreTheFirstFourteenNames)
{
    ASSERT_EQ(kTrackedJoints.size(), 14u);
    for (std::size_t i = 0; i < kTrackedJoints.size(); ++i) {
        EXPECT_EQ(jointIndex(kTrackedJoints[i]), i);
        EXPECT_TRUE(isTrackedJoint(kTrackedJoints[i]));
    }
    EXPECT_FALSE(isTrackedJoint(JointName::LeftEye));
    EXPECT_FALSE(isTrackedJoint(JointName::Root));
}

TEST(BodyJoint, NamesUseCamelCase)
{
    EXPECT_STREQ(toString(JointName::Nose), "nose");
    EXPECT_STREQ(toString(JointName::LeftKnee), "leftKnee");
    EXPECT_STREQ(toString(JointName::RightShoulder), "rightShoulder");
    EXPECT_STREQ(toString(JointName::Root), "root");
}

TEST(BodyJoint, ParsesEveryName)
{
    for (std::size_t i = 0; i < kNumJointNames; ++i) {
        const auto name = static_cast<JointName>(i);
        const auto parsed = parseJointName(toString(name));
        ASSERT_TRUE(parsed.has_value()) << toString(name);
        EXPECT_EQ(*parsed, name);
    }
}

TEST(BodyJoint, HeadIsAnAliasForNose)
{
    EXPECT_EQ(parseJointName("head"), JointName::Nose);
}

TEST(BodyJoint, RejectsUnknownNames)
{
    EXPECT_FALSE(parseJointName("leftToe").has_value());
    EXPECT_FALSE(parseJointName("LeftKnee").has_value());
    EXPECT_FALSE(parseJointName("").has_value());
}
