// OpenPoseBackend.cpp
// OpenPose wrapper producing PoseObservations.

#include "OpenPoseBackend.h"

#include <iostream>
#include <utility>
#include <vector>

namespace {

// OpenPose BODY_25 part index -> our joint vocabulary.
// Feet (19-24) have no counterpart and are ignored.
const std::vector<std::pair<int, JointName>> BODY25_TO_JOINT = {
    {0, JointName::Nose},
    {1, JointName::Neck},
    {2, JointName::RightShoulder},
    {3, JointName::RightElbow},
    {4, JointName::RightWrist},
    {5, JointName::LeftShoulder},
    {6, JointName::LeftElbow},
    {7, JointName::LeftWrist},
    {8, JointName::Root},           // MidHip
    {9, JointName::RightHip},
    {10, JointName::RightKnee},
    {11, JointName::RightAnkle},
    {12, JointName::LeftHip},
    {13, JointName::LeftKnee},
    {14, JointName::LeftAnkle},
    {15, JointName::RightEye},
    {16, JointName::LeftEye},
    {17, JointName::RightEar},
    {18, JointName::LeftEar}
};

} // namespace

OpenPoseBackend::OpenPoseBackend(const Options& options)
{
    // Configure OpenPose model parameters
    op::WrapperStructPose poseConfig;
    poseConfig.poseModel = op::PoseModel::BODY_25;
    poseConfig.modelFolder = options.modelFolder.c_str();
    poseConfig.netInputSize = {options.netInputWidth, options.netInputHeight};

    // We only need keypoints, not the rendered image
    poseConfig.renderMode = op::RenderMode::None;

    openpose_ = std::make_unique<op::Wrapper>(op::ThreadManagerMode::Asynchronous);
    openpose_->configure(poseConfig);
    // Must be started before detecting any frames
    openpose_->start();

    std::cout << "OpenPoseBackend: started with models from " << options.modelFolder << "\n";
}

OpenPoseBackend::~OpenPoseBackend()
{
    if (openpose_)
        openpose_->stop();
}

std::optional<PoseObservation> OpenPoseBackend::detect(const cv::Mat& image, int /*frameIdx*/)
{
    auto input = OP_CV2OPCONSTMAT(image);
    auto result = openpose_->emplaceAndPop(input);

    if (!result || result->empty()) // No detections
        return std::nullopt;

    const auto& datum = result->at(0);
    const auto& kp = datum->poseKeypoints;
    if (kp.empty() || kp.getSize(0) == 0)
        return std::nullopt;

    // Person 0 only
    const int numParts = kp.getSize(1);
    const float width = static_cast<float>(image.cols);
    const float height = static_cast<float>(image.rows);

    PoseObservation observation;
    for (const auto& [part, name] : BODY25_TO_JOINT) {
        if (part >= numParts)
            continue;

        const int idx = 3 * part;
        const float score = kp[idx + 2];
        if (score <= 0.0f) // OpenPose reports missing parts as (0, 0, 0)
            continue;

        RecognizedPoint point;
        point.x = kp[idx] / width;
        point.y = 1.0f - kp[idx + 1] / height;
        point.confidence = score;
        observation.setPoint(name, point);
    }

    const auto& scores = datum->poseScores;
    observation.confidence = scores.empty() ? 0.0f : scores[0];
    return observation;
}
