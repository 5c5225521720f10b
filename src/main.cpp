// main.cpp
// ---------
// Pipeline entry point.
// This only orchestrates the modules; all logic lives in separate classes.
// Steps:
//  1) Check the recording against minimum standards (VideoQualityValidator)
//  2) Sample frames (FrameSampler)
//  3) Detect a pose per frame from precomputed keypoints (PoseSequenceBuilder)
//  4) Score every pose for the exercise and export (QualityScorer, PoseExport)
//
// Keypoints come from tools/extract_keypoints, which runs OpenPose over the
// same sampled frames.

#include "ExerciseType.h"
#include "FrameSampler.h"
#include "PipelineConfig.h"
#include "PoseDetectionError.h"
#include "PoseDetector.h"
#include "PoseExport.h"
#include "PoseSequenceBuilder.h"
#include "PrecomputedPoseBackend.h"
#include "QualityScorer.h"
#include "VideoQualityValidator.h"

#include <iomanip>
#include <iostream>
#include <string>

static void printUsage(const char* argv0)
{
    std::cout << "Usage: " << argv0
              << " <video_path> <keypoints_json> [exercise] [--config file.json] [--output file.json]\n"
              << "  exercise: squat | deadlift | benchPress | shoulderPress | pullUp | unknown\n";
}

int main(int argc, char* argv[])
{
    if (argc < 3) {
        printUsage(argv[0]);
        return 1;
    }

    const std::string videoPath = argv[1];
    const std::string keypointsPath = argv[2];

    PipelineConfig config;
    std::string exerciseArg;
    std::string outputArg;

    for (int i = 3; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            if (!config.loadFromJson(std::string(argv[++i])))
                return 1;
        } else if (arg == "--output" && i + 1 < argc) {
            outputArg = argv[++i];
        } else if (exerciseArg.empty() && arg.rfind("--", 0) != 0) {
            exerciseArg = arg;
        } else {
            printUsage(argv[0]);
            return 1;
        }
    }

    // Command line wins over the config file
    if (!exerciseArg.empty()) {
        const auto exercise = parseExerciseType(exerciseArg);
        if (!exercise) {
            std::cerr << "Unknown exercise: " << exerciseArg << "\n";
            printUsage(argv[0]);
            return 1;
        }
        config.exercise = *exercise;
    }
    if (!outputArg.empty())
        config.outputPath = outputArg;

    try {
        VideoQualityValidator validator;
        const VideoQualityReport report = validator.validateVideo(videoPath);
        std::cout << "Video: " << report.width << "x" << report.height << ", "
                  << report.frameRate << " fps, ";
        if (report.duration)
            std::cout << *report.duration << " s";
        else
            std::cout << "unknown duration";
        std::cout << " (quality " << std::setprecision(2) << report.qualityScore() << ")\n";
        for (const auto& issue : validator.findIssues(report))
            std::cout << "Warning: " << issue.description << "\n";

        FrameSampler sampler(config.sampler);
        const std::vector<cv::Mat> frames = sampler.sampleFile(videoPath);
        std::cout << "Sampled " << frames.size() << " frames\n";

        PrecomputedPoseBackend backend;
        if (!backend.loadKeypoints(keypointsPath))
            return 1;

        PoseDetector detector(backend);
        PoseSequenceBuilder::Options buildOpts;
        buildOpts.frameInterval = config.sampler.frameInterval;
        PoseSequenceBuilder builder(detector, buildOpts);

        const std::vector<PoseEstimate> poses = builder.build(frames);
        std::cout << "Detected poses in " << poses.size() << " of "
                  << frames.size() << " frames\n";

        int acceptable = 0;
        for (const auto& pose : poses) {
            const QualityAssessment quality = QualityScorer::score(pose, config.exercise);
            if (quality.isAcceptable)
                acceptable++;
        }

        const SequenceQuality summary = QualityScorer::summarize(poses);
        std::cout << displayName(config.exercise) << ": " << acceptable << "/" << poses.size()
                  << " acceptable poses, sequence quality " << std::setprecision(2)
                  << summary.overallScore << " (" << toString(summary.qualityLevel()) << ")\n";

        if (!savePoseSequence(config.outputPath, poses, config.exercise))
            return 1;
        std::cout << "Output written to " << config.outputPath << "\n";

    } catch (const VideoQualityError& e) {
        std::cerr << e.what() << "\nPlease re-record or re-import a clearer or longer video.\n";
        return 2;
    } catch (const PoseDetectionError& e) {
        std::cerr << e.what() << "\nPlease re-record or re-import a clearer or longer video.\n";
        return 2;
    }

    return 0;
}
