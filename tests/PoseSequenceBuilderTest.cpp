#include "PoseDetectionError.h"
#include "PoseSequenceBuilder.h"
#include "TestFakes.h"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <limits>
#include <set>
#include <stdexcept>

namespace {

PoseSequenceBuilder::Options builderOptions()
{
    PoseSequenceBuilder::Options options;
    options.frameInterval = 0.1;
    options.captureStart = PoseEstimate::Clock::time_point(std::chrono::hours(24));
    return options;
}

} // namespace

TEST(PoseSequenceBuilder, EveryFrameFailing)
{
    FakePoseBackend backend([](const cv::Mat&) { return std::optional<PoseObservation>(); });
    PoseDetector detector(backend);
    PoseSequenceBuilder builder(detector, builderOptions());

    try {
        builder.build(numberedFrames(10));
        FAIL() << "expected InsufficientValidPoses";
    } catch (const PoseDetectionError& e) {
        EXPECT_EQ(e.kind(), PoseDetectionError::Kind::InsufficientValidPoses);
        EXPECT_EQ(e.detected(), 0);
        EXPECT_EQ(e.required(), 1);
    }
    EXPECT_EQ(backend.calls(), 10);
    EXPECT_EQ(builder.droppedFrames(), 10u);
}

TEST(PoseSequenceBuilder, NoFramesAtAll)
{
    FakePoseBackend backend([](const cv::Mat&) { return std::optional<PoseObservation>(fullObservation(0.9f)); });
    PoseDetector detector(backend);
    PoseSequenceBuilder builder(detector, builderOptions());

    EXPECT_THROW(builder.build({}), PoseDetectionError);
}

TEST(PoseSequenceBuilder, KeepsOriginalFramePositions)
{
    const std::set<int> detectedFrames = {2, 5, 7};
    FakePoseBackend backend([&](const cv::Mat& frame) {
        if (detectedFrames.count(frameId(frame)))
            return std::optional<PoseObservation>(fullObservation(0.9f));
        return std::optional<PoseObservation>();
    });
    PoseDetector detector(backend);
    const auto options = builderOptions();
    PoseSequenceBuilder builder(detector, options);

    const std::vector<PoseEstimate> poses = builder.build(numberedFrames(10));

    ASSERT_EQ(poses.size(), 3u);
    EXPECT_EQ(poses[0].frameIndex(), 2);
    EXPECT_EQ(poses[1].frameIndex(), 5);
    EXPECT_EQ(poses[2].frameIndex(), 7);
    EXPECT_EQ(builder.droppedFrames(), 7u);

    for (const auto& pose : poses) {
        const auto offset = std::chrono::duration_cast<std::chrono::microseconds>(
            pose.timestamp() - options.captureStart);
        EXPECT_NEAR(static_cast<double>(offset.count()), pose.frameIndex() * 100000.0, 1.0);
    }
}

TEST(PoseSequenceBuilder, FrameErrorsDoNotStopTheSequence)
{
    FakePoseBackend backend([](const cv::Mat& frame) -> std::optional<PoseObservation> {
        const int id = frameId(frame);
        if (id == 0)
            throw std::runtime_error("inference timeout");
        if (id == 1) {
            PoseObservation broken = fullObservation(0.9f);
            broken.confidence = std::numeric_limits<float>::infinity();
            return broken;
        }
        return fullObservation(0.9f);
    });
    PoseDetector detector(backend);
    PoseSequenceBuilder builder(detector, builderOptions());

    const std::vector<PoseEstimate> poses = builder.build(numberedFrames(4));
    ASSERT_EQ(poses.size(), 2u);
    EXPECT_EQ(poses[0].frameIndex(), 2);
    EXPECT_EQ(poses[1].frameIndex(), 3);
}

TEST(PoseSequenceBuilder, ReportsProgressPerFrame)
{
    FakePoseBackend backend([](const cv::Mat&) { return std::optional<PoseObservation>(fullObservation(0.9f)); });
    PoseDetector detector(backend);
    PoseSequenceBuilder builder(detector, builderOptions());

    std::vector<std::size_t> processed;
    builder.build(numberedFrames(5), [&](std::size_t done, std::size_t total) {
        EXPECT_EQ(total, 5u);
        processed.push_back(done);
    });

    const std::vector<std::size_t> expected = {1, 2, 3, 4, 5};
    EXPECT_EQ(processed, expected);
}

TEST(PoseSequenceBuilder, CancelsBetweenFrames)
{
    FakePoseBackend backend([](const cv::Mat&) { return std::optional<PoseObservation>(fullObservation(0.9f)); });
    PoseDetector detector(backend);
    PoseSequenceBuilder builder(detector, builderOptions());

    std::atomic<bool> cancel{false};
    auto stopAfterThree = [&](std::size_t done, std::size_t) {
        if (done == 3)
            cancel = true;
    };

    try {
        builder.build(numberedFrames(10), stopAfterThree, &cancel);
        FAIL() << "expected Cancelled";
    } catch (const PoseDetectionError& e) {
        EXPECT_EQ(e.kind(), PoseDetectionError::Kind::Cancelled);
    }
    EXPECT_EQ(backend.calls(), 3);
}

TEST(PoseSequenceBuilder, NonStandardBackendFailureIsAbsorbed)
{
    FakePoseBackend backend([](const cv::Mat& frame) -> std::optional<PoseObservation> {
        if (frameId(frame) == 1)
            throw "decoder exploded";
        return fullObservation(0.9f);
    });
    PoseDetector detector(backend);
    PoseSequenceBuilder builder(detector, builderOptions());

    const std::vector<PoseEstimate> poses = builder.build(numberedFrames(3));
    ASSERT_EQ(poses.size(), 2u);
    EXPECT_EQ(poses[0].frameIndex(), 0);
    EXPECT_EQ(poses[1].frameIndex(), 2);
    EXPECT_EQ(backend.lastFrameIdx(), 2);
}
