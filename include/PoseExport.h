// PoseExport
// -----------
// Serializes a scored pose sequence to JSON for the critique engine or
// for offline inspection.

#pragma once

#include "ExerciseType.h"
#include "PoseEstimate.h"

#include <nlohmann/json_fwd.hpp>

#include <string>
#include <vector>

nlohmann::json poseToJson(const PoseEstimate& pose);

// Each pose with its quality assessment, plus the sequence summary
nlohmann::json poseSequenceToJson(const std::vector<PoseEstimate>& poses, ExerciseType exercise);

bool savePoseSequence(const std::string& jsonPath,
                      const std::vector<PoseEstimate>& poses,
                      ExerciseType exercise);
