// QualityScorer.cpp
// Per-pose and per-sequence quality scores.

#include "QualityScorer.h"

#include <Eigen/Dense>

#include <algorithm>
#include <cmath>

namespace {

struct MeanAndDeviation
{
    double mean = 0.0;
    double stddev = 0.0;
};

// Population statistics. Empty input gives mean 0; fewer than two
// samples give a deviation of 0.
MeanAndDeviation meanAndDeviation(const Eigen::ArrayXd& values)
{
    MeanAndDeviation result;
    if (values.size() == 0)
        return result;

    result.mean = values.mean();
    if (values.size() < 2)
        return result;

    const double variance = (values - result.mean).square().mean();
    result.stddev = std::sqrt(variance);
    return result;
}

} // namespace

QualityLevel classifyQuality(double overall)
{
    if (overall >= 0.8 && overall <= 1.0)
        return QualityLevel::Excellent;
    if (overall >= 0.6 && overall < 0.8)
        return QualityLevel::Good;
    if (overall >= 0.4 && overall < 0.6)
        return QualityLevel::Fair;
    return QualityLevel::Poor;
}

const char* toString(QualityLevel level)
{
    switch (level) {
    case QualityLevel::Excellent: return "Excellent";
    case QualityLevel::Good:      return "Good";
    case QualityLevel::Fair:      return "Fair";
    case QualityLevel::Poor:      return "Poor";
    }
    return "Poor";
}

QualityAssessment QualityScorer::score(const PoseEstimate& pose, ExerciseType exercise)
{
    const std::vector<JointName>& required = requiredJoints(exercise);
    const std::vector<BodyJoint> detected = pose.allValidJoints();

    Eigen::ArrayXd confidences(static_cast<Eigen::Index>(detected.size()));
    for (std::size_t i = 0; i < detected.size(); ++i)
        confidences(static_cast<Eigen::Index>(i)) = static_cast<double>(detected[i].confidence);

    const MeanAndDeviation stats = meanAndDeviation(confidences);

    QualityAssessment result;
    result.completenessScore = static_cast<double>(detected.size()) / static_cast<double>(required.size());
    result.confidenceScore = stats.mean;
    result.stabilityScore = std::max(0.0, 1.0 - stats.stddev);
    result.overallQuality = result.completenessScore * kCompletenessWeight
                          + result.confidenceScore * kConfidenceWeight
                          + result.stabilityScore * kStabilityWeight;

    for (JointName name : required) {
        const bool found = std::any_of(detected.begin(), detected.end(),
                                       [name](const BodyJoint& j) { return j.name == name; });
        if (!found)
            result.missingJoints.push_back(name);
    }

    result.isAcceptable = result.overallQuality >= kMinOverallQuality
                       && result.completenessScore >= kMinCompleteness;
    return result;
}

SequenceQuality QualityScorer::summarize(const std::vector<PoseEstimate>& poses)
{
    SequenceQuality result;
    if (poses.empty())
        return result;

    const Eigen::Index n = static_cast<Eigen::Index>(poses.size());
    Eigen::ArrayXd confidences(n);
    Eigen::ArrayXd validCounts(n);
    for (Eigen::Index i = 0; i < n; ++i) {
        const PoseEstimate& pose = poses[static_cast<std::size_t>(i)];
        confidences(i) = static_cast<double>(pose.overallConfidence());
        validCounts(i) = static_cast<double>(pose.allValidJoints().size());
    }

    const MeanAndDeviation stats = meanAndDeviation(confidences);
    const double maxJoints = validCounts.maxCoeff();

    result.averageConfidence = stats.mean;
    result.completenessScore = maxJoints > 0.0 ? validCounts.sum() / (static_cast<double>(n) * maxJoints) : 0.0;
    result.consistencyScore = std::max(0.0, 1.0 - stats.stddev);
    result.overallScore = result.averageConfidence * 0.4
                        + result.completenessScore * 0.4
                        + result.consistencyScore * 0.2;
    return result;
}
