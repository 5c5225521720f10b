// extract_keypoints.cpp
//
// Standalone preprocessing tool.
// Runs OpenPose ONCE over the sampled frames of a video and saves the
// normalized keypoints to a JSON file that PrecomputedPoseBackend replays.
//
// Usage:
//   ./extract_keypoints video.mp4 keypoints.json [--config file.json]
//
// The frame sampler settings must match the ones used when scoring, since
// entries are keyed by sampled frame index.

#include "FrameSampler.h"
#include "OpenPoseBackend.h"
#include "PipelineConfig.h"
#include "PoseDetectionError.h"
#include "PrecomputedPoseBackend.h"

#include <iostream>
#include <string>

int main(int argc, char** argv)
{
    // Expects two arguments: input video path, output JSON file path
    if (argc != 3 && argc != 5) {
        std::cerr << "Usage: " << argv[0]
                  << " <video_path> <output_json> [--config file.json]\n";
        return 1;
    }

    const std::string videoPath = argv[1];
    const std::string outputPath = argv[2];

    PipelineConfig config;
    if (argc == 5) {
        if (std::string(argv[3]) != "--config" || !config.loadFromJson(std::string(argv[4])))
            return 1;
    }

    std::vector<cv::Mat> frames;
    try {
        frames = FrameSampler(config.sampler).sampleFile(videoPath);
    } catch (const PoseDetectionError& e) {
        std::cerr << "Failed to sample video: " << e.what() << "\n";
        return 1;
    }

    OpenPoseBackend openpose(config.openpose);
    PrecomputedPoseBackend::ObservationMap observations;

    for (std::size_t frameIdx = 0; frameIdx < frames.size(); ++frameIdx) {
        try {
            auto observation = openpose.detect(frames[frameIdx], static_cast<int>(frameIdx));
            // Skip frames with no detection
            if (observation)
                observations[static_cast<int>(frameIdx)] = *observation;
        } catch (const std::exception& e) {
            std::cerr << "OpenPose failed on frame " << frameIdx << ": " << e.what() << "\n";
            continue;
        }

        std::cout << "Processed frame " << frameIdx + 1 << "/" << frames.size() << "\n";
    }

    if (!saveKeypoints(outputPath, observations))
        return 1;

    std::cout << "Saved keypoints for " << observations.size()
              << " frames to " << outputPath << "\n";
    return 0;
}
