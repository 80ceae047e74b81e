#include "settings.hpp"
#include "debug.hpp"
#include "parse.hpp"

#include <cctype>
#include <cmath>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>

namespace {

template<typename T>
void readValue(std::istringstream& iss, const std::string& key, size_t lineNo, T& out) {
    std::string token;
    T value;
    if (!(iss >> token) || !parseNumber(token, value)) {
        throw std::runtime_error("Invalid value for '" + key + "' on line " + std::to_string(lineNo));
    }
    out = value;
}

// Counts are read signed so that "-1" is rejected instead of wrapping
void readCount(std::istringstream& iss, const std::string& key, size_t lineNo, size_t& out) {
    long long value = 0;
    readValue(iss, key, lineNo, value);
    if (value < 0) {
        throw std::runtime_error("Negative value for '" + key + "' on line " + std::to_string(lineNo));
    }
    out = static_cast<size_t>(value);
}

// Everything after the key, leading whitespace dropped
std::string restOfLine(std::istringstream& iss) {
    std::string rest;
    std::getline(iss >> std::ws, rest);
    while (!rest.empty() && std::isspace(static_cast<unsigned char>(rest.back()))) {
        rest.pop_back();
    }
    return rest;
}

}

Settings loadSettings(const std::string& settingsFile) {
    std::ifstream in(settingsFile);
    if (!in) {
        std::cerr << "No settings file found. Using defaults." << std::endl;
        return Settings();
    }
    return loadSettings(in);
}

Settings loadSettings(std::istream& in) {
    Settings s;
    std::string line;
    size_t lineNo = 0;
    while (std::getline(in, line)) {
        ++lineNo;
        std::istringstream iss(line);
        std::string key;
        if (!(iss >> key) || key[0] == '#') continue;

        if (key == "inputDir") {
            s.inputDir = restOfLine(iss);
        } else if (key == "outputDir") {
            s.outputDir = restOfLine(iss);
        } else if (key == "file") {
            s.filesToRead.push_back(restOfLine(iss));
        } else if (key == "logFile") {
            s.logFile = restOfLine(iss);
        } else if (key == "minPoisPerZone") {
            readCount(iss, key, lineNo, s.zoneConfig.minPoisPerZone);
        } else if (key == "maxPoisPerZone") {
            readCount(iss, key, lineNo, s.zoneConfig.maxPoisPerZone);
        } else if (key == "clusterRadiusMeters") {
            readValue(iss, key, lineNo, s.zoneConfig.clusterRadiusMeters);
        } else if (key == "mapWidth") {
            readValue(iss, key, lineNo, s.zoneConfig.mapSize.width);
        } else if (key == "mapHeight") {
            readValue(iss, key, lineNo, s.zoneConfig.mapSize.height);
        } else {
            DBG("Ignoring unknown setting '" << key << "' on line " << lineNo);
        }
    }
    return s;
}

void validateZoneConfig(const ZoneConfig& config) {
    if (config.minPoisPerZone < 1) {
        throw std::invalid_argument("minPoisPerZone must be at least 1");
    }
    if (config.maxPoisPerZone < 1) {
        throw std::invalid_argument("maxPoisPerZone must be at least 1");
    }
    if (config.minPoisPerZone > config.maxPoisPerZone) {
        throw std::invalid_argument("minPoisPerZone (" + std::to_string(config.minPoisPerZone)
            + ") exceeds maxPoisPerZone (" + std::to_string(config.maxPoisPerZone) + ")");
    }
    if (!std::isfinite(config.clusterRadiusMeters) || config.clusterRadiusMeters <= 0) {
        throw std::invalid_argument("clusterRadiusMeters must be a positive distance");
    }
    if (!(config.mapSize.width > 0) || !(config.mapSize.height > 0)) {
        throw std::invalid_argument("map size must be positive");
    }
}
