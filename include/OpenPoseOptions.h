// OpenPoseOptions
// ----------------
// OpenPose settings, kept apart from OpenPoseBackend so configuration
// code does not need the OpenPose headers.

#pragma once

#include <string>

struct OpenPoseOptions
{
    std::string modelFolder = "/opt/openpose/models/";

    // Network input size in pixels: smaller = faster but less accurate
    int netInputWidth = 320;
    int netInputHeight = 176;
};
