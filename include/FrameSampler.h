// FrameSampler
// -------------
// Picks an evenly strided, bounded set of still images out of a video.
// Responsibilities:
//  - stride = max(1, round(fps * frameInterval))
//  - keep every stride-th source frame that decodes
//  - stop after maxFrames kept frames
// Used by:
//  - main and extract_keypoints, ahead of PoseSequenceBuilder

#pragma once

#include "VideoSource.h"

#include <opencv2/core.hpp>
#include <string>
#include <vector>

class FrameSampler
{
public:
    struct Options
    {
        double frameInterval = 0.1;   // seconds between kept frames
        int maxFrames = 300;          // ~30 s of output at the default interval
    };

    FrameSampler() = default;
    explicit FrameSampler(const Options& options);

    static int computeStride(double fps, double frameInterval);

    // Throws PoseDetectionError(NoVideoTrack) if the source has no
    // visual track. Undecodable frames are skipped; an empty result is
    // not an error.
    std::vector<cv::Mat> sample(VideoSource& source) const;

    // Opens the file with VideoLoader, then sample()
    std::vector<cv::Mat> sampleFile(const std::string& path) const;

    const Options& options() const { return options_; }

private:
    Options options_;
};
