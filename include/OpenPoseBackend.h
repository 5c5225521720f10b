// OpenPoseBackend
// ----------------
// Live PoseBackend on top of OpenPose (BODY_25 model).
// Responsibilities:
//  - Initialize OpenPose once with the configured model folder and net size
//  - Run it per frame and report the first detected person
//  - Map BODY_25 parts to JointName and normalize the pixel output
// The wrapper threads live as long as this object.

#pragma once

#include "OpenPoseOptions.h"
#include "PoseBackend.h"

#include <openpose/headers.hpp>

#include <memory>

class OpenPoseBackend : public PoseBackend
{
public:
    using Options = OpenPoseOptions;

    explicit OpenPoseBackend(const Options& options);
    ~OpenPoseBackend() override;

    std::optional<PoseObservation> detect(const cv::Mat& image, int frameIdx) override;

private:
    std::unique_ptr<op::Wrapper> openpose_;
};
