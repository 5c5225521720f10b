// PrecomputedPoseBackend.cpp
// Loading and saving of precomputed keypoint files.

#include "PrecomputedPoseBackend.h"

#include <nlohmann/json.hpp>

#include <fstream>
#include <iostream>

using json = nlohmann::json;

bool PrecomputedPoseBackend::loadKeypoints(const std::string& jsonPath)
{
    std::ifstream in(jsonPath);
    if (!in.is_open()) {
        std::cerr << "Failed to open keypoints file: " << jsonPath << "\n";
        return false;
    }

    json j;
    try {
        in >> j;
    } catch (const std::exception& e) {
        std::cerr << "PrecomputedPoseBackend::loadKeypoints - JSON parse error: " << e.what() << "\n";
        return false;
    }
    return loadKeypoints(j);
}

bool PrecomputedPoseBackend::loadKeypoints(const json& j)
{
    if (!j.is_object()) {
        std::cerr << "PrecomputedPoseBackend::loadKeypoints - expected an object keyed by frame index\n";
        return false;
    }

    ObservationMap poses;
    try {
        for (auto& [frameStr, entry] : j.items()) {
            PoseObservation observation;
            observation.confidence = entry.value("confidence", 0.0f);

            for (auto& [jointStr, p] : entry.at("joints").items()) {
                const auto name = parseJointName(jointStr);
                if (!name) {
                    std::cerr << "PrecomputedPoseBackend::loadKeypoints - unknown joint '"
                              << jointStr << "' in frame " << frameStr << "\n";
                    continue;
                }
                observation.setPoint(*name, {
                    p.at("x").get<float>(),
                    p.at("y").get<float>(),
                    p.at("score").get<float>()
                });
            }
            poses[std::stoi(frameStr)] = observation;
        }
    } catch (const std::exception& e) {
        std::cerr << "PrecomputedPoseBackend::loadKeypoints - invalid keypoints: " << e.what() << "\n";
        return false;
    }

    cachedPoses_ = std::move(poses);

    std::cout << "Loaded keypoints for "
              << cachedPoses_.size() << " frames\n";
    return true;
}

std::optional<PoseObservation> PrecomputedPoseBackend::detect(const cv::Mat& /*image*/, int frameIdx)
{
    auto it = cachedPoses_.find(frameIdx);
    if (it == cachedPoses_.end())
        return std::nullopt;
    return it->second;
}

json keypointsToJson(const PrecomputedPoseBackend::ObservationMap& observations)
{
    json allFrames = json::object();

    for (const auto& [frameIdx, observation] : observations) {
        json joints = json::object();
        for (std::size_t i = 0; i < kNumJointNames; ++i) {
            const auto& p = observation.points[i];
            if (!p)
                continue;
            joints[toString(static_cast<JointName>(i))] = {
                {"x",     p->x},
                {"y",     p->y},
                {"score", p->confidence}
            };
        }

        allFrames[std::to_string(frameIdx)] = {
            {"confidence", observation.confidence},
            {"joints", joints}
        };
    }
    return allFrames;
}

bool saveKeypoints(const std::string& jsonPath,
                   const PrecomputedPoseBackend::ObservationMap& observations)
{
    std::ofstream out(jsonPath);
    if (!out.is_open()) {
        std::cerr << "Failed to open keypoints file for writing: " << jsonPath << "\n";
        return false;
    }
    out << keypointsToJson(observations).dump(2);
    return true;
}
