// PoseDetectionError
// -------------------
// Single exception type for the sampling / detection pipeline.
// Asset-level (NoVideoTrack, FrameExtractionFailed) and sequence-level
// (InsufficientValidPoses, Cancelled) kinds reach the caller.
// RequestExecutionFailed and InvalidPoseData are per-frame and are
// absorbed by PoseSequenceBuilder.

#pragma once

#include <stdexcept>
#include <string>

class PoseDetectionError : public std::runtime_error
{
public:
    enum class Kind
    {
        NoVideoTrack,
        FrameExtractionFailed,
        RequestExecutionFailed,
        InsufficientValidPoses,
        InvalidPoseData,
        Cancelled
    };

    PoseDetectionError(Kind kind, const std::string& detail = std::string());

    static PoseDetectionError insufficientValidPoses(int detected, int required);

    Kind kind() const { return kind_; }

    // Only meaningful for InsufficientValidPoses
    int detected() const { return detected_; }
    int required() const { return required_; }

private:
    PoseDetectionError(Kind kind, const std::string& message, int detected, int required);

    Kind kind_;
    int detected_ = 0;
    int required_ = 0;
};

const char* toString(PoseDetectionError::Kind kind);
