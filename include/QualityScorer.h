// QualityScorer
// --------------
// Measures how usable a detected pose is for a given exercise.
// Responsibilities:
//  - Per pose: completeness / confidence / stability / overall scores,
//    missing required joints and an accept/reject verdict
//  - Per sequence: a summary of whole-pose confidence and joint coverage
// Pure computation: no I/O, never throws.
// Used by:
//  - main (gating a video before form analysis), PoseExport

#pragma once

#include "ExerciseType.h"
#include "PoseEstimate.h"

#include <vector>

enum class QualityLevel
{
    Excellent,
    Good,
    Fair,
    Poor
};

// [0.8, 1.0] Excellent, [0.6, 0.8) Good, [0.4, 0.6) Fair, anything else Poor
QualityLevel classifyQuality(double overall);

// "Excellent", "Good", ...
const char* toString(QualityLevel level);

struct QualityAssessment
{
    double overallQuality = 0.0;
    double confidenceScore = 0.0;
    double completenessScore = 0.0;
    double stabilityScore = 0.0;
    std::vector<JointName> missingJoints;
    bool isAcceptable = false;

    QualityLevel qualityLevel() const { return classifyQuality(overallQuality); }
};

// Quality of a whole pose sequence, from whole-pose confidences
struct SequenceQuality
{
    double averageConfidence = 0.0;
    double completenessScore = 0.0;
    double consistencyScore = 0.0;
    double overallScore = 0.0;

    QualityLevel qualityLevel() const { return classifyQuality(overallScore); }
};

class QualityScorer
{
public:
    // Weights of the overall score
    static constexpr double kCompletenessWeight = 0.4;
    static constexpr double kConfidenceWeight = 0.4;
    static constexpr double kStabilityWeight = 0.2;

    // Acceptance gate: both must hold
    static constexpr double kMinOverallQuality = 0.6;
    static constexpr double kMinCompleteness = 0.7;

    // Completeness is |valid joints| / |required joints| and is not
    // clamped: a pose with more valid joints than the exercise needs
    // scores above 1.
    static QualityAssessment score(const PoseEstimate& pose, ExerciseType exercise);

    static SequenceQuality summarize(const std::vector<PoseEstimate>& poses);
};
