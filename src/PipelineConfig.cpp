// PipelineConfig.cpp

#include "PipelineConfig.h"

#include <nlohmann/json.hpp>

#include <fstream>
#include <iostream>

using nlohmann::json;

bool PipelineConfig::loadFromJson(const std::string& jsonPath)
{
    std::ifstream in(jsonPath);
    if (!in.is_open()) {
        std::cerr << "PipelineConfig::loadFromJson - cannot open file: " << jsonPath << "\n";
        return false;
    }

    json j;
    try {
        in >> j;
    } catch (const std::exception& e) {
        std::cerr << "PipelineConfig::loadFromJson - JSON parse error: " << e.what() << "\n";
        return false;
    }
    return loadFromJson(j);
}

bool PipelineConfig::loadFromJson(const json& j)
{
    if (!j.is_object()) {
        std::cerr << "PipelineConfig::loadFromJson - expected a JSON object\n";
        return false;
    }

    PipelineConfig cfg = *this;
    try {
        cfg.sampler.frameInterval = j.value("frameInterval", cfg.sampler.frameInterval);
        cfg.sampler.maxFrames = j.value("maxFrames", cfg.sampler.maxFrames);
        cfg.outputPath = j.value("output", cfg.outputPath);

        if (j.contains("exercise")) {
            const std::string name = j.at("exercise").get<std::string>();
            const auto exercise = parseExerciseType(name);
            if (!exercise) {
                std::cerr << "PipelineConfig::loadFromJson - unknown exercise: " << name << "\n";
                return false;
            }
            cfg.exercise = *exercise;
        }

        if (j.contains("openpose")) {
            const auto& openposeCfg = j.at("openpose");
            cfg.openpose.modelFolder = openposeCfg.value("modelFolder", cfg.openpose.modelFolder);
            cfg.openpose.netInputWidth = openposeCfg.value("netInputWidth", cfg.openpose.netInputWidth);
            cfg.openpose.netInputHeight = openposeCfg.value("netInputHeight", cfg.openpose.netInputHeight);
        }
    } catch (const std::exception& e) {
        std::cerr << "PipelineConfig::loadFromJson - invalid value: " << e.what() << "\n";
        return false;
    }

    if (!(cfg.sampler.frameInterval > 0.0) || cfg.sampler.maxFrames <= 0) {
        std::cerr << "PipelineConfig::loadFromJson - frameInterval and maxFrames must be positive\n";
        return false;
    }

    *this = cfg;
    return true;
}
