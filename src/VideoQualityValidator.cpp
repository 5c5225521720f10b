// VideoQualityValidator.cpp

#include "VideoQualityValidator.h"
#include "PoseDetectionError.h"
#include "VideoLoader.h"

#include <algorithm>
#include <filesystem>
#include <iomanip>
#include <sstream>
#include <utility>

namespace {

std::string formatSeconds(double seconds)
{
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(1) << seconds << "s";
    return ss.str();
}

std::string formatMegabytes(std::uintmax_t bytes)
{
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(1) << static_cast<double>(bytes) / (1024.0 * 1024.0) << " MB";
    return ss.str();
}

} // namespace

double VideoQualityReport::qualityScore() const
{
    double score = 1.0;

    // Optimal duration: 10-60 seconds
    if (duration) {
        if (*duration < 10.0)
            score *= 0.8;
        else if (*duration > 60.0)
            score *= 0.9;
    }

    score *= std::min(width / 1920.0, 1.0) * std::min(height / 1080.0, 1.0);

    // Optimal frame rate: 30 fps
    score *= std::min(frameRate / 30.0, 1.0);

    return std::max(score, 0.0);
}

bool VideoQualityIssue::isCritical() const
{
    switch (kind) {
    case Kind::DurationTooShort:
    case Kind::ResolutionTooLow:
    case Kind::FrameRateTooLow:
        return true;
    case Kind::DurationTooLong:
    case Kind::FileSizeTooLarge:
        return false;
    }
    return true;
}

VideoQualityError::VideoQualityError(Kind kind, const std::string& message,
                                     std::vector<VideoQualityIssue> issues)
    : std::runtime_error(message), kind_(kind), issues_(std::move(issues))
{
}

VideoQualityValidator::VideoQualityValidator(const Standards& standards)
    : standards_(standards)
{
}

VideoQualityReport VideoQualityValidator::inspect(const VideoSource& source) const
{
    if (!source.hasVideoTrack())
        throw VideoQualityError(VideoQualityError::Kind::NoVideoTrack, "No video track found in the file");

    VideoQualityReport report;
    report.width = source.width();
    report.height = source.height();
    report.frameRate = source.fps();
    if (report.frameRate > 0.0 && source.frameCount() > 0)
        report.duration = static_cast<double>(source.frameCount()) / report.frameRate;
    return report;
}

VideoQualityReport VideoQualityValidator::inspect(const std::string& path) const
{
    std::error_code ec;
    const std::uintmax_t fileSize = std::filesystem::file_size(path, ec);
    if (ec) {
        throw VideoQualityError(VideoQualityError::Kind::FileNotReadable,
                                "Video file is not readable: " + path);
    }

    try {
        VideoLoader loader(path);
        VideoQualityReport report = inspect(loader);
        report.fileSize = fileSize;
        return report;
    } catch (const PoseDetectionError& e) {
        throw VideoQualityError(VideoQualityError::Kind::FileNotReadable, e.what());
    }
}

std::vector<VideoQualityIssue> VideoQualityValidator::findIssues(const VideoQualityReport& report) const
{
    using Kind = VideoQualityIssue::Kind;
    std::vector<VideoQualityIssue> issues;

    // An unknown duration is not checked
    if (report.duration) {
        const double seconds = *report.duration;
        if (seconds < standards_.minimumDuration) {
            issues.push_back({Kind::DurationTooShort,
                              "Video too short: " + formatSeconds(seconds) +
                              " (minimum: " + formatSeconds(standards_.minimumDuration) + ")"});
        } else if (seconds > standards_.maximumDuration) {
            issues.push_back({Kind::DurationTooLong,
                              "Video too long: " + formatSeconds(seconds) +
                              " (maximum: " + formatSeconds(standards_.maximumDuration) + ")"});
        }
    }

    if (report.width < standards_.minimumWidth || report.height < standards_.minimumHeight) {
        issues.push_back({Kind::ResolutionTooLow,
                          "Resolution too low: " + std::to_string(report.width) + "x" +
                          std::to_string(report.height) + " (minimum: " +
                          std::to_string(standards_.minimumWidth) + "x" +
                          std::to_string(standards_.minimumHeight) + ")"});
    }

    if (report.frameRate < standards_.minimumFrameRate) {
        std::ostringstream ss;
        ss << std::fixed << std::setprecision(1)
           << "Frame rate too low: " << report.frameRate << "fps (minimum: "
           << standards_.minimumFrameRate << "fps)";
        issues.push_back({Kind::FrameRateTooLow, ss.str()});
    }

    if (report.fileSize > standards_.maximumFileSize) {
        issues.push_back({Kind::FileSizeTooLarge,
                          "File size too large: " + formatMegabytes(report.fileSize) +
                          " (maximum: " + formatMegabytes(standards_.maximumFileSize) + ")"});
    }

    return issues;
}

void VideoQualityValidator::validate(const VideoQualityReport& report) const
{
    std::vector<VideoQualityIssue> critical;
    for (auto& issue : findIssues(report)) {
        if (issue.isCritical())
            critical.push_back(std::move(issue));
    }

    if (critical.empty())
        return;

    std::string message = "Video quality is below standards:";
    for (const auto& issue : critical)
        message += "\n" + issue.description;
    throw VideoQualityError(VideoQualityError::Kind::QualityBelowStandards, message, std::move(critical));
}

VideoQualityReport VideoQualityValidator::validateVideo(const std::string& path) const
{
    VideoQualityReport report = inspect(path);
    validate(report);
    return report;
}
