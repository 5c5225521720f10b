// TestFakes
// ----------
// Deterministic stand-ins for the video and the pose model.

#pragma once

#include "PoseBackend.h"
#include "PoseEstimate.h"
#include "VideoSource.h"

#include <opencv2/core.hpp>

#include <functional>
#include <initializer_list>
#include <set>
#include <utility>
#include <vector>

// Video whose frame i is a 1x1 CV_32S image holding i.
class FakeVideoSource : public VideoSource
{
public:
    FakeVideoSource(double fps, long numFrames, std::set<long> undecodable = {},
                    bool hasTrack = true, int width = 1080, int height = 1920)
        : fps_(fps), numFrames_(numFrames), undecodable_(std::move(undecodable)),
          hasTrack_(hasTrack), width_(width), height_(height)
    {
    }

    bool hasVideoTrack() const override { return hasTrack_; }
    double fps() const override { return fps_; }
    int width() const override { return width_; }
    int height() const override { return height_; }
    long frameCount() const override { return numFrames_; }

    ReadStatus next(cv::Mat& frame) override
    {
        if (position_ >= numFrames_)
            return ReadStatus::End;
        const long index = position_++;
        reads_++;
        if (undecodable_.count(index))
            return ReadStatus::DecodeFailed;
        frame = cv::Mat(1, 1, CV_32S, cv::Scalar(static_cast<double>(index)));
        return ReadStatus::Frame;
    }

    long reads() const { return reads_; }

private:
    double fps_;
    long numFrames_;
    std::set<long> undecodable_;
    bool hasTrack_;
    int width_;
    int height_;
    long position_ = 0;
    long reads_ = 0;
};

inline int frameId(const cv::Mat& frame) { return frame.at<int>(0, 0); }

// Backend driven by a callable
class FakePoseBackend : public PoseBackend
{
public:
    using Handler = std::function<std::optional<PoseObservation>(const cv::Mat&)>;

    explicit FakePoseBackend(Handler handler) : handler_(std::move(handler)) {}

    std::optional<PoseObservation> detect(const cv::Mat& image, int frameIdx) override
    {
        calls_++;
        lastFrameIdx_ = frameIdx;
        return handler_(image);
    }

    int calls() const { return calls_; }
    int lastFrameIdx() const { return lastFrameIdx_; }

private:
    Handler handler_;
    int calls_ = 0;
    int lastFrameIdx_ = -1;
};

// Observation with every tracked joint at (0.5, 0.5) and the given confidence
inline PoseObservation fullObservation(float jointConfidence, float poseConfidence = 0.9f)
{
    PoseObservation observation;
    for (JointName name : kTrackedJoints)
        observation.setPoint(name, {0.5f, 0.5f, jointConfidence});
    observation.confidence = poseConfidence;
    return observation;
}

// Pose holding exactly the listed joints
inline PoseEstimate makePose(std::initializer_list<std::pair<JointName, float>> joints,
                             float overallConfidence = 0.9f)
{
    PoseEstimate::JointSlots slots;
    float x = 10.0f;
    for (const auto& [name, confidence] : joints) {
        BodyJoint joint;
        joint.name = name;
        joint.confidence = confidence;
        joint.position = cv::Point2f(x, 2.0f * x);
        slots[jointIndex(name)] = joint;
        x += 10.0f;
    }
    return PoseEstimate(slots, overallConfidence);
}

// Frames whose pixel (0,0) holds their index, as the fake backend expects
inline std::vector<cv::Mat> numberedFrames(int count)
{
    std::vector<cv::Mat> frames;
    for (int i = 0; i < count; ++i)
        frames.push_back(cv::Mat(4, 4, CV_32S, cv::Scalar(i)));
    return frames;
}
