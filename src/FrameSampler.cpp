// FrameSampler.cpp

#include "FrameSampler.h"
#include "PoseDetectionError.h"
#include "VideoLoader.h"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <limits>

FrameSampler::FrameSampler(const Options& options)
    : options_(options)
{
}

int FrameSampler::computeStride(double fps, double frameInterval)
{
    const double framesPerSample = fps * frameInterval;
    if (!std::isfinite(framesPerSample) || framesPerSample <= 0.0)
        return 1;
    // A corrupt frame rate must not overflow the cast
    const double maxStride = static_cast<double>(std::numeric_limits<int>::max());
    if (framesPerSample >= maxStride)
        return std::numeric_limits<int>::max();
    return std::max(1, static_cast<int>(std::lround(framesPerSample)));
}

std::vector<cv::Mat> FrameSampler::sample(VideoSource& source) const
{
    if (!source.hasVideoTrack())
        throw PoseDetectionError(PoseDetectionError::Kind::NoVideoTrack);

    const int stride = computeStride(source.fps(), options_.frameInterval);

    std::vector<cv::Mat> frames;
    long sourceIndex = 0;
    int skipped = 0;
    cv::Mat frame;

    while (static_cast<int>(frames.size()) < options_.maxFrames) {
        const VideoSource::ReadStatus status = source.next(frame);
        if (status == VideoSource::ReadStatus::End)
            break;

        sourceIndex++;
        if (sourceIndex % stride != 0)
            continue;

        if (status == VideoSource::ReadStatus::DecodeFailed) {
            skipped++;
            continue;
        }

        // The source may reuse its buffer between reads
        frames.push_back(frame.clone());
    }

    if (skipped > 0) {
        std::cerr << "FrameSampler: skipped " << skipped
                  << " undecodable frame(s)\n";
    }
    return frames;
}

std::vector<cv::Mat> FrameSampler::sampleFile(const std::string& path) const
{
    VideoLoader loader(path);
    return sample(loader);
}
