#pragma once

#include <filesystem>
#include <istream>
#include <optional>
#include <string>
#include <vector>

#include "structures.hpp"

// Batch settings: directories, file filter, log target and the zone config
struct Settings {
    std::filesystem::path inputDir = "./data/pois";
    std::filesystem::path outputDir = "./data/zones";
    std::vector<std::string> filesToRead; // empty = process all
    std::optional<std::filesystem::path> logFile; // optional log file
    ZoneConfig zoneConfig;
};

// Read settings from a file (key value per line, # comments).
// A missing file yields the defaults; a malformed value throws std::runtime_error.
Settings loadSettings(const std::string& settingsFile);
Settings loadSettings(std::istream& in);

// Rejects configs the planner would cluster degenerately. Throws std::invalid_argument.
void validateZoneConfig(const ZoneConfig& config);
