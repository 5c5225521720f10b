// ExerciseType
// -------------
// Exercises we know how to assess and the joints each one needs to be
// visible. Used by QualityScorer only.

#pragma once

#include "BodyJoint.h"

#include <optional>
#include <string>
#include <vector>

enum class ExerciseType
{
    Squat,
    Deadlift,
    BenchPress,
    ShoulderPress,
    PullUp,
    Unknown
};

// Ordered required-joint set. Unknown asks for the full landmark
// vocabulary, eyes, ears and root included.
const std::vector<JointName>& requiredJoints(ExerciseType type);

// "benchPress"
const char* toString(ExerciseType type);

// "Bench Press"
const char* displayName(ExerciseType type);

// Accepts the toString() form
std::optional<ExerciseType> parseExerciseType(const std::string& text);
