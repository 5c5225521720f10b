// PoseDetectionError.cpp

#include "PoseDetectionError.h"

namespace {

std::string describe(PoseDetectionError::Kind kind, const std::string& detail)
{
    std::string message;
    switch (kind) {
    case PoseDetectionError::Kind::NoVideoTrack:
        message = "No video track found in the video file";
        break;
    case PoseDetectionError::Kind::FrameExtractionFailed:
        message = "Failed to extract frames from video";
        break;
    case PoseDetectionError::Kind::RequestExecutionFailed:
        message = "Pose estimation request failed";
        break;
    case PoseDetectionError::Kind::InsufficientValidPoses:
        message = "Insufficient valid poses detected";
        break;
    case PoseDetectionError::Kind::InvalidPoseData:
        message = "Invalid or corrupted pose data";
        break;
    case PoseDetectionError::Kind::Cancelled:
        message = "Pose detection cancelled";
        break;
    }
    if (!detail.empty())
        message += ": " + detail;
    return message;
}

} // namespace

PoseDetectionError::PoseDetectionError(Kind kind, const std::string& detail)
    : std::runtime_error(describe(kind, detail)), kind_(kind)
{
}

PoseDetectionError::PoseDetectionError(Kind kind, const std::string& message,
                                       int detected, int required)
    : std::runtime_error(message), kind_(kind), detected_(detected), required_(required)
{
}

PoseDetectionError PoseDetectionError::insufficientValidPoses(int detected, int required)
{
    const std::string detail = std::to_string(detected) + " (required: " + std::to_string(required) + ")";
    return PoseDetectionError(Kind::InsufficientValidPoses,
                              describe(Kind::InsufficientValidPoses, detail),
                              detected, required);
}

const char* toString(PoseDetectionError::Kind kind)
{
    switch (kind) {
    case PoseDetectionError::Kind::NoVideoTrack:           return "NoVideoTrack";
    case PoseDetectionError::Kind::FrameExtractionFailed:  return "FrameExtractionFailed";
    case PoseDetectionError::Kind::RequestExecutionFailed: return "RequestExecutionFailed";
    case PoseDetectionError::Kind::InsufficientValidPoses: return "InsufficientValidPoses";
    case PoseDetectionError::Kind::InvalidPoseData:        return "InvalidPoseData";
    case PoseDetectionError::Kind::Cancelled:              return "Cancelled";
    }
    return "Unknown";
}
