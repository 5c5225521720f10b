// PoseDetector.cpp
// Implementation of the PoseDetector class (backend adapter).
//
// Contains the code for:
//   - running the backend on a frame
//   - converting its output to our internal joint format

#include "PoseDetector.h"
#include "PoseDetectionError.h"

#include <cmath>
#include <exception>

cv::Point2f normalizedToImage(const cv::Point2f& normalized, const cv::Size& imageSize)
{
    // Backend origin is bottom-left, image rows grow downwards: flip y
    return cv::Point2f(normalized.x * imageSize.width,
                       (1.0f - normalized.y) * imageSize.height);
}

PoseDetector::PoseDetector(PoseBackend& backend)
    : backend_(backend)
{
}

std::optional<PoseEstimate> PoseDetector::detect(const cv::Mat& frame, int frameIdx)
{
    if (frame.empty()) {
        throw PoseDetectionError(PoseDetectionError::Kind::RequestExecutionFailed,
                                 "empty image");
    }

    std::optional<PoseObservation> observation;
    try {
        observation = backend_.detect(frame, frameIdx);
    } catch (const PoseDetectionError&) {
        throw;
    } catch (const std::exception& e) {
        throw PoseDetectionError(PoseDetectionError::Kind::RequestExecutionFailed, e.what());
    } catch (...) {
        throw PoseDetectionError(PoseDetectionError::Kind::RequestExecutionFailed,
                                 "unknown backend error");
    }

    if (!observation) // No detections
        return std::nullopt;

    if (!std::isfinite(observation->confidence)) {
        throw PoseDetectionError(PoseDetectionError::Kind::InvalidPoseData,
                                 "non-finite pose confidence");
    }

    const cv::Size imageSize = frame.size();
    PoseEstimate::JointSlots joints;

    for (JointName name : kTrackedJoints) {
        const auto& point = observation->point(name);
        if (!point)
            continue;

        if (!std::isfinite(point->x) || !std::isfinite(point->y) || !std::isfinite(point->confidence)) {
            throw PoseDetectionError(PoseDetectionError::Kind::InvalidPoseData,
                                     std::string("non-finite value for ") + toString(name));
        }

        if (point->confidence <= kJointAcceptanceThreshold)
            continue;

        BodyJoint joint;
        joint.position = normalizedToImage(cv::Point2f(point->x, point->y), imageSize);
        joint.confidence = point->confidence;
        joint.name = name;
        joints[jointIndex(name)] = joint;
    }

    return PoseEstimate(joints, observation->confidence);
}
