// PoseSequenceBuilder
// --------------------
// Runs the PoseDetector over every sampled frame, in order, and collects
// the frames where a body was found.
// Per-frame failures (backend errors, unusable output, no body) are logged
// and skipped: a sequence is best effort, not all-or-nothing.
// frameIndex is the position in the sampled frame list, so dropped frames
// leave gaps.

#pragma once

#include "PoseDetector.h"
#include "PoseEstimate.h"

#include <opencv2/core.hpp>

#include <atomic>
#include <cstddef>
#include <functional>
#include <vector>

class PoseSequenceBuilder
{
public:
    struct Options
    {
        // Seconds between sampled frames; must match the sampler
        double frameInterval = 0.1;

        // Timestamp of sampled frame 0
        PoseEstimate::Clock::time_point captureStart = PoseEstimate::Clock::now();
    };

    // (frames processed so far, total frames)
    using ProgressCallback = std::function<void(std::size_t, std::size_t)>;

    PoseSequenceBuilder(PoseDetector& detector, const Options& options);

    // Throws PoseDetectionError:
    //  - InsufficientValidPoses(0, 1) if no frame yielded a pose
    //  - Cancelled if *cancel becomes true; checked between frames
    std::vector<PoseEstimate> build(const std::vector<cv::Mat>& frames,
                                    const ProgressCallback& progress = ProgressCallback(),
                                    const std::atomic<bool>* cancel = nullptr);

    // Frames dropped by the last build()
    std::size_t droppedFrames() const { return droppedFrames_; }

private:
    PoseDetector& detector_;
    Options options_;
    std::size_t droppedFrames_ = 0;
};
