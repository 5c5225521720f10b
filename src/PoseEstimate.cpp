// PoseEstimate.cpp

#include "PoseEstimate.h"
#include "PoseDetectionError.h"

#include <cstdio>
#include <random>

namespace {

// Random (version 4) UUID string
std::string makePoseId()
{
    static thread_local std::mt19937_64 rng{std::random_device{}()};
    std::uniform_int_distribution<unsigned long long> dist;

    unsigned long long hi = dist(rng);
    unsigned long long lo = dist(rng);
    hi = (hi & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
    lo = (lo & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

    char buf[37];
    std::snprintf(buf, sizeof(buf), "%08llx-%04llx-%04llx-%04llx-%012llx",
                  hi >> 32, (hi >> 16) & 0xFFFFULL, hi & 0xFFFFULL,
                  lo >> 48, lo & 0xFFFFFFFFFFFFULL);
    return std::string(buf);
}

const std::optional<BodyJoint> NO_JOINT;

} // namespace

PoseEstimate::PoseEstimate(const JointSlots& joints, float overallConfidence)
    : id_(makePoseId()),
      timestamp_(Clock::now()),
      joints_(joints),
      overallConfidence_(overallConfidence)
{
    for (std::size_t i = 0; i < joints_.size(); ++i) {
        const auto& slot = joints_[i];
        if (!slot)
            continue;
        if (jointIndex(slot->name) != i) {
            throw PoseDetectionError(PoseDetectionError::Kind::InvalidPoseData,
                                     std::string("joint ") + toString(slot->name) +
                                     " stored in slot " + toString(kTrackedJoints[i]));
        }
        if (!(slot->confidence > kJointAcceptanceThreshold)) {
            throw PoseDetectionError(PoseDetectionError::Kind::InvalidPoseData,
                                     std::string("joint ") + toString(slot->name) +
                                     " below acceptance threshold");
        }
    }
}

const std::optional<BodyJoint>& PoseEstimate::joint(JointName name) const
{
    if (!isTrackedJoint(name))
        return NO_JOINT;
    return joints_[jointIndex(name)];
}

std::vector<BodyJoint> PoseEstimate::allJoints() const
{
    std::vector<BodyJoint> result;
    result.reserve(joints_.size());
    for (const auto& slot : joints_) {
        if (slot)
            result.push_back(*slot);
    }
    return result;
}

std::vector<BodyJoint> PoseEstimate::allValidJoints() const
{
    std::vector<BodyJoint> result;
    for (const auto& slot : joints_) {
        if (slot && slot->confidence > kJointValidThreshold)
            result.push_back(*slot);
    }
    return result;
}

std::optional<cv::Point2f> PoseEstimate::centerOfMass() const
{
    const std::vector<BodyJoint> valid = allValidJoints();
    if (valid.empty())
        return std::nullopt;

    double sumX = 0.0;
    double sumY = 0.0;
    for (const auto& j : valid) {
        sumX += j.position.x;
        sumY += j.position.y;
    }
    const double n = static_cast<double>(valid.size());
    return cv::Point2f(static_cast<float>(sumX / n), static_cast<float>(sumY / n));
}
