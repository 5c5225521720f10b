// VideoLoader
// ------------
// - Responsible ONLY for reading frames from a video file.
// - Hides OpenCV's VideoCapture from the rest of the system.

#pragma once

#include "VideoSource.h"

#include <opencv2/videoio.hpp>
#include <string>

class VideoLoader : public VideoSource {
public:
    // Throws PoseDetectionError(FrameExtractionFailed) if the file is
    // missing or cannot be opened.
    explicit VideoLoader(const std::string& path);

    const std::string& path() const { return path_; }

    bool hasVideoTrack() const override;
    double fps() const override;
    int width() const override;
    int height() const override;
    long frameCount() const override;

    ReadStatus next(cv::Mat& frame) override;

private:
    std::string path_;
    mutable cv::VideoCapture cap;
};
