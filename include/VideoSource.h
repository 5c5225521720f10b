// VideoSource
// ------------
// Sequential access to a video's visual track.
// VideoLoader is the OpenCV implementation; tests provide their own.

#pragma once

#include <opencv2/core.hpp>

class VideoSource
{
public:
    enum class ReadStatus
    {
        Frame,          // frame decoded into the output image
        DecodeFailed,   // a source frame exists but could not be decoded
        End             // no more source frames
    };

    virtual ~VideoSource() = default;

    virtual bool hasVideoTrack() const = 0;

    // Nominal frame rate of the visual track
    virtual double fps() const = 0;
    virtual int width() const = 0;
    virtual int height() const = 0;

    // Container's frame count; may be an estimate or 0 if unknown
    virtual long frameCount() const = 0;

    virtual ReadStatus next(cv::Mat& frame) = 0;
};
