// PrecomputedPoseBackend
// -----------------------
// Replays keypoints saved by extract_keypoints instead of running a model.
// Running OpenPose once and reusing its output keeps scoring experiments
// fast and deterministic.
//
// File layout (frame index = position in the sampled frame list):
//   {
//     "0": { "confidence": 0.91,
//            "joints": { "neck": {"x": 0.51, "y": 0.80, "score": 0.93}, ... } },
//     "3": { ... }
//   }
// Coordinates are normalized with the origin at the bottom-left.
// Frames without an entry had no detected body.

#pragma once

#include "PoseBackend.h"

#include <nlohmann/json_fwd.hpp>

#include <map>
#include <string>

class PrecomputedPoseBackend : public PoseBackend
{
public:
    using ObservationMap = std::map<int, PoseObservation>;

    PrecomputedPoseBackend() = default;

    bool loadKeypoints(const std::string& jsonPath);
    bool loadKeypoints(const nlohmann::json& j);

    // Returns the entry stored for frameIdx; the image is not looked at
    std::optional<PoseObservation> detect(const cv::Mat& image, int frameIdx) override;

    std::size_t size() const { return cachedPoses_.size(); }

private:
    ObservationMap cachedPoses_;
};

nlohmann::json keypointsToJson(const PrecomputedPoseBackend::ObservationMap& observations);
bool saveKeypoints(const std::string& jsonPath,
                   const PrecomputedPoseBackend::ObservationMap& observations);
