// PoseSequenceBuilder.cpp

#include "PoseSequenceBuilder.h"
#include "PoseDetectionError.h"

#include <chrono>
#include <iostream>

PoseSequenceBuilder::PoseSequenceBuilder(PoseDetector& detector, const Options& options)
    : detector_(detector), options_(options)
{
}

std::vector<PoseEstimate> PoseSequenceBuilder::build(const std::vector<cv::Mat>& frames,
                                                     const ProgressCallback& progress,
                                                     const std::atomic<bool>* cancel)
{
    std::vector<PoseEstimate> poseSequence;
    droppedFrames_ = 0;

    for (std::size_t index = 0; index < frames.size(); ++index) {
        if (cancel && cancel->load()) {
            throw PoseDetectionError(PoseDetectionError::Kind::Cancelled,
                                     "stopped before frame " + std::to_string(index));
        }

        try {
            std::optional<PoseEstimate> pose = detector_.detect(frames[index], static_cast<int>(index));
            if (pose) {
                const auto offset = std::chrono::duration<double>(static_cast<double>(index) * options_.frameInterval);
                pose->setFrameIndex(static_cast<int>(index));
                pose->setTimestamp(options_.captureStart +
                                   std::chrono::duration_cast<PoseEstimate::Clock::duration>(offset));
                poseSequence.push_back(std::move(*pose));
            } else {
                droppedFrames_++;
                std::cerr << "PoseSequenceBuilder: no pose in frame " << index << "\n";
            }
        } catch (const PoseDetectionError& e) {
            droppedFrames_++;
            std::cerr << "PoseSequenceBuilder: failed to detect pose in frame "
                      << index << ": " << e.what() << "\n";
        }

        if (progress)
            progress(index + 1, frames.size());
    }

    if (poseSequence.empty())
        throw PoseDetectionError::insufficientValidPoses(0, 1);

    return poseSequence;
}
