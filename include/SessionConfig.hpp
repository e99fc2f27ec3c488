#pragma once

#include <string>

#include <nlohmann/json.hpp>

#include "BoardDescriptor.hpp"

struct SessionConfig {
    int boardId = static_cast<int>(BoardIds::SYNTHETIC_BOARD);
    std::string port;
    int bufferSize = 3600;
    unsigned int streamMs = 5000;
    double bandpassLow = 1.0;
    double bandpassHigh = 50.0;
    int logLevel = 4;
    std::string outputRaw = "before_processing.csv";
    std::string outputReloaded = "before_preprocessing2.csv";
    std::string outputProcessed = "after_preprocessing.csv";
};

// Missing keys keep their defaults. Throw BoardException(INVALID_ARGUMENTS_ERROR)
// on unreadable files, malformed JSON or values of the wrong type.
SessionConfig SessionConfigFromJson(const nlohmann::json& json);
SessionConfig LoadSessionConfig(const std::string& path);

nlohmann::json SessionConfigToJson(const SessionConfig& config);
