// VideoLoader.cpp
// Implementation of the VideoLoader class declared in VideoLoader.h.
//
// grab() advances the container; retrieve() decodes. Splitting the two
// lets the sampler tell a corrupt frame apart from the end of the stream.

#include "VideoLoader.h"
#include "PoseDetectionError.h"

#include <filesystem>

VideoLoader::VideoLoader(const std::string& path)
    : path_(path)
{
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        throw PoseDetectionError(PoseDetectionError::Kind::FrameExtractionFailed,
                                 "cannot read " + path);
    }

    cap.open(path);
    if (!cap.isOpened()) {
        throw PoseDetectionError(PoseDetectionError::Kind::FrameExtractionFailed,
                                 "cannot open " + path);
    }
}

bool VideoLoader::hasVideoTrack() const { return width() > 0 && height() > 0; }

double VideoLoader::fps() const { return cap.get(cv::CAP_PROP_FPS); }
int VideoLoader::width() const { return (int)cap.get(cv::CAP_PROP_FRAME_WIDTH); }
int VideoLoader::height() const { return (int)cap.get(cv::CAP_PROP_FRAME_HEIGHT); }
long VideoLoader::frameCount() const { return (long)cap.get(cv::CAP_PROP_FRAME_COUNT); }

VideoSource::ReadStatus VideoLoader::next(cv::Mat& frame)
{
    if (!cap.grab())
        return ReadStatus::End;

    if (!cap.retrieve(frame) || frame.empty())
        return ReadStatus::DecodeFailed;

    return ReadStatus::Frame;
}
