#include "PipelineConfig.h"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <fstream>

using json = nlohmann::json;

TEST(PipelineConfig, Defaults)
{
    const PipelineConfig config;
    EXPECT_DOUBLE_EQ(config.sampler.frameInterval, 0.1);
    EXPECT_EQ(config.sampler.maxFrames, 300);
    EXPECT_EQ(config.exercise, ExerciseType::Unknown);
    EXPECT_EQ(config.outputPath, "pose_sequence.json");
    EXPECT_EQ(config.openpose.modelFolder, "/opt/openpose/models/");
    EXPECT_EQ(config.openpose.netInputWidth, 320);
    EXPECT_EQ(config.openpose.netInputHeight, 176);
}

TEST(PipelineConfig, OverridesGivenKeys)
{
    PipelineConfig config;
    ASSERT_TRUE(config.loadFromJson(json::parse(R"({
        "frameInterval": 0.2,
        "exercise": "deadlift",
        "openpose": { "netInputWidth": 656 }
    })")));

    EXPECT_DOUBLE_EQ(config.sampler.frameInterval, 0.2);
    EXPECT_EQ(config.sampler.maxFrames, 300);
    EXPECT_EQ(config.exercise, ExerciseType::Deadlift);
    EXPECT_EQ(config.openpose.netInputWidth, 656);
    EXPECT_EQ(config.openpose.netInputHeight, 176);
}

TEST(PipelineConfig, InvalidValuesLeaveConfigUntouched)
{
    PipelineConfig config;
    EXPECT_FALSE(config.loadFromJson(json::parse(R"({"exercise": "lunge", "maxFrames": 10})")));
    EXPECT_FALSE(config.loadFromJson(json::parse(R"({"frameInterval": -1.0})")));
    EXPECT_FALSE(config.loadFromJson(json::parse(R"({"maxFrames": "many"})")));
    EXPECT_FALSE(config.loadFromJson(json::array()));

    EXPECT_EQ(config.sampler.maxFrames, 300);
    EXPECT_DOUBLE_EQ(config.sampler.frameInterval, 0.1);
    EXPECT_EQ(config.exercise, ExerciseType::Unknown);
}

TEST(PipelineConfig, LoadsFromFile)
{
    const std::string path = ::testing::TempDir() + "posequality_config.json";
    {
        std::ofstream out(path);
        out << R"({"maxFrames": 120, "output": "squat.json", "exercise": "squat"})";
    }

    PipelineConfig config;
    ASSERT_TRUE(config.loadFromJson(path));
    EXPECT_EQ(config.sampler.maxFrames, 120);
    EXPECT_EQ(config.outputPath, "squat.json");
    EXPECT_EQ(config.exercise, ExerciseType::Squat);
}

TEST(PipelineConfig, MissingFile)
{
    PipelineConfig config;
    EXPECT_FALSE(config.loadFromJson(std::string("/nonexistent/config.json")));
}
