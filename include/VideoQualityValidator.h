// VideoQualityValidator
// ----------------------
// Checks an input video against minimum recording standards before any
// frame is sampled.
// Responsibilities:
//  - Read duration, resolution, frame rate and file size
//  - Flag issues; critical ones reject the video
//  - Score overall recording quality in [0, 1]
// Used by:
//  - main (before sampling)

#pragma once

#include "VideoSource.h"

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

struct VideoQualityReport
{
    // Seconds; empty when the container does not report a frame count
    std::optional<double> duration;
    int width = 0;
    int height = 0;
    double frameRate = 0.0;
    std::uintmax_t fileSize = 0;

    // 1.0 for a 10-60 s, 1080p, 30 fps recording. An unknown duration
    // does not lower the score.
    double qualityScore() const;
    bool isHighQuality() const { return qualityScore() >= 0.8; }
};

struct VideoQualityIssue
{
    enum class Kind
    {
        DurationTooShort,
        DurationTooLong,
        ResolutionTooLow,
        FrameRateTooLow,
        FileSizeTooLarge
    };

    Kind kind;
    std::string description;

    bool isCritical() const;
};

class VideoQualityError : public std::runtime_error
{
public:
    enum class Kind
    {
        FileNotReadable,
        NoVideoTrack,
        QualityBelowStandards
    };

    VideoQualityError(Kind kind, const std::string& message,
                      std::vector<VideoQualityIssue> issues = {});

    Kind kind() const { return kind_; }
    const std::vector<VideoQualityIssue>& issues() const { return issues_; }

private:
    Kind kind_;
    std::vector<VideoQualityIssue> issues_;
};

class VideoQualityValidator
{
public:
    struct Standards
    {
        double minimumDuration = 3.0;
        double maximumDuration = 300.0;
        int minimumWidth = 480;
        int minimumHeight = 640;
        double minimumFrameRate = 15.0;
        std::uintmax_t maximumFileSize = 500ull * 1024 * 1024;
    };

    VideoQualityValidator() = default;
    explicit VideoQualityValidator(const Standards& standards);

    // Reads the report for a file. Throws VideoQualityError
    // (FileNotReadable, NoVideoTrack).
    VideoQualityReport inspect(const std::string& path) const;

    // Report for an already opened source; fileSize is left at 0
    VideoQualityReport inspect(const VideoSource& source) const;

    // All issues, critical or not. Duration is only checked when known.
    std::vector<VideoQualityIssue> findIssues(const VideoQualityReport& report) const;

    // Throws VideoQualityError(QualityBelowStandards) listing the critical
    // issues, if any
    void validate(const VideoQualityReport& report) const;

    // inspect() + validate()
    VideoQualityReport validateVideo(const std::string& path) const;

private:
    Standards standards_;
};
