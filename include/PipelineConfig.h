// PipelineConfig
// ---------------
// Settings for the command line tools, optionally read from JSON.
//
//   {
//     "frameInterval": 0.1,
//     "maxFrames": 300,
//     "exercise": "squat",
//     "output": "pose_sequence.json",
//     "openpose": { "modelFolder": "/opt/openpose/models/",
//                   "netInputWidth": 320, "netInputHeight": 176 }
//   }
//
// Every key is optional; missing keys keep their defaults.

#pragma once

#include "ExerciseType.h"
#include "FrameSampler.h"
#include "OpenPoseOptions.h"

#include <nlohmann/json_fwd.hpp>

#include <string>

struct PipelineConfig
{
    FrameSampler::Options sampler;
    OpenPoseOptions openpose;
    ExerciseType exercise = ExerciseType::Unknown;
    std::string outputPath = "pose_sequence.json";

    // Leaves the current values untouched on failure
    bool loadFromJson(const std::string& jsonPath);
    bool loadFromJson(const nlohmann::json& j);
};
