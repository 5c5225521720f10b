// PoseExport.cpp

#include "PoseExport.h"
#include "QualityScorer.h"

#include <nlohmann/json.hpp>

#include <chrono>
#include <fstream>
#include <iostream>

using json = nlohmann::json;

namespace {

json assessmentToJson(const QualityAssessment& assessment)
{
    json missing = json::array();
    for (JointName name : assessment.missingJoints)
        missing.push_back(toString(name));

    return {
        {"overallQuality",    assessment.overallQuality},
        {"confidenceScore",   assessment.confidenceScore},
        {"completenessScore", assessment.completenessScore},
        {"stabilityScore",    assessment.stabilityScore},
        {"missingJoints",     missing},
        {"isAcceptable",      assessment.isAcceptable},
        {"qualityLevel",      toString(assessment.qualityLevel())}
    };
}

} // namespace

json poseToJson(const PoseEstimate& pose)
{
    const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
        pose.timestamp().time_since_epoch()).count();

    json joints = json::object();
    for (const auto& joint : pose.allJoints()) {
        joints[toString(joint.name)] = {
            {"x",     joint.position.x},
            {"y",     joint.position.y},
            {"score", joint.confidence}
        };
    }

    return {
        {"id",                pose.id()},
        {"frameIndex",        pose.frameIndex()},
        {"timestampMs",       millis},
        {"overallConfidence", pose.overallConfidence()},
        {"joints",            joints}
    };
}

json poseSequenceToJson(const std::vector<PoseEstimate>& poses, ExerciseType exercise)
{
    json frames = json::array();
    for (const auto& pose : poses) {
        json entry = poseToJson(pose);
        entry["quality"] = assessmentToJson(QualityScorer::score(pose, exercise));
        frames.push_back(entry);
    }

    const SequenceQuality summary = QualityScorer::summarize(poses);

    return {
        {"exercise", toString(exercise)},
        {"poses",    frames},
        {"sequenceQuality", {
            {"averageConfidence", summary.averageConfidence},
            {"completenessScore", summary.completenessScore},
            {"consistencyScore",  summary.consistencyScore},
            {"overallScore",      summary.overallScore},
            {"qualityLevel",      toString(summary.qualityLevel())}
        }}
    };
}

bool savePoseSequence(const std::string& jsonPath,
                      const std::vector<PoseEstimate>& poses,
                      ExerciseType exercise)
{
    std::ofstream out(jsonPath);
    if (!out.is_open()) {
        std::cerr << "Error: Could not open file for writing: " << jsonPath << std::endl;
        return false;
    }

    out << poseSequenceToJson(poses, exercise).dump(2);  // Pretty-printed JSON
    return true;
}
