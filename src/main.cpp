#include "ZonePlanner.hpp"
#include "settings.hpp"
#include "io.hpp"

#include <algorithm>
#include <chrono>
#include <exception>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

int main() {
    std::ios::sync_with_stdio(false);
    std::cin.tie(nullptr);

    // Load settings
    Settings settings;
    try {
        settings = loadSettings("settings.txt");
        validateZoneConfig(settings.zoneConfig);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
    const ZoneConfig& config = settings.zoneConfig;

    std::cout << "Settings:\n";
    std::cout << "  Input directory: " << settings.inputDir << "\n";
    std::cout << "  Output directory: " << settings.outputDir << "\n";
    if (!settings.filesToRead.empty()) {
        std::cout << "  Files to read:\n";
        for (const auto& f : settings.filesToRead) {
            std::cout << "    " << f << "\n";
        }
    } else {
        std::cout << "  Processing all files in input directory.\n";
    }
    std::cout << "  Log file: " << (settings.logFile ? settings.logFile->string() : "stdout") << "\n";
    std::cout << "  POIs per zone: " << config.minPoisPerZone << ".." << config.maxPoisPerZone << "\n";
    std::cout << "  Cluster radius: " << config.clusterRadiusMeters << " m\n";
    std::cout << "  Map size: " << config.mapSize.width << "x" << config.mapSize.height << "\n";

    // Set up logging
    std::ofstream logFile;
    std::ostream& logStream = [&]() -> std::ostream& {
        if (settings.logFile) {
            logFile.open(*settings.logFile); // overwrite mode
            if (logFile) {
                return logFile;
            } else {
                std::cerr << "Failed to open log file. Falling back to stdout.\n";
            }
        }
        return std::cout;
    }();

    namespace fs = std::filesystem;
    std::error_code ec;
    if (!fs::is_directory(settings.inputDir, ec)) {
        std::cerr << "Error: input directory " << settings.inputDir << " does not exist\n";
        return 1;
    }
    fs::create_directories(settings.outputDir, ec);
    if (ec) {
        std::cerr << "Error: cannot create output directory " << settings.outputDir
                  << ": " << ec.message() << "\n";
        return 1;
    }
    logStream << "Input directory: " << settings.inputDir << "\n";
    logStream << "Output directory: " << settings.outputDir << "\n";

    // Sorted so the processing order doesn't depend on the filesystem
    std::vector<fs::path> inputFiles;
    for (const auto& entry : fs::directory_iterator(settings.inputDir)) {
        if (!entry.is_regular_file()) continue;
        if (!settings.filesToRead.empty()) {
            if (std::find(settings.filesToRead.begin(),
                          settings.filesToRead.end(),
                          entry.path().filename().string()) == settings.filesToRead.end()) {
                continue;
            }
        }
        inputFiles.push_back(entry.path());
    }
    std::sort(inputFiles.begin(), inputFiles.end());

    size_t failures = 0;
    for (const fs::path& inputFile : inputFiles) {
        const fs::path outputFile = settings.outputDir / inputFile.filename();

        logStream << "Processing file: " << inputFile << "\n";

        auto startTime = std::chrono::high_resolution_clock::now();

        std::vector<POI> pois;
        try {
            pois = readPOIFile(inputFile.string());
        } catch (const std::exception& e) {
            logStream << e.what() << "\n";
            ++failures;
            continue;
        }

        auto zones = planZones(pois, config);
        if (!verifyZones(zones, pois.size(), config)) {
            logStream << "Zone verification failed for file: " << inputFile << "\n";
            ++failures;
            continue;
        }

        std::ofstream outFile(outputFile);
        if (!outFile) {
            logStream << "Failed to open output file: " << outputFile << "\n";
            ++failures;
            continue;
        }
        writeZones(outFile, zones);
        outFile.close();

        auto endTime = std::chrono::high_resolution_clock::now();
        auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(endTime - startTime).count();

        auto undersized = std::count_if(zones.begin(), zones.end(), [&](const Zone& z) {
            return z.poiIndices.size() < config.minPoisPerZone;
        });
        logStream << "Finished processing file: " << inputFile
                  << " in " << duration << " ms, pois=" << pois.size()
                  << ", zones=" << zones.size()
                  << ", undersized=" << undersized << "\n";
        for (const auto& zone : zones) {
            logStream << "  " << zone.id << ":";
            for (const POI& poi : getZonePOIs(pois, zone)) {
                logStream << " [" << (poi.name.empty() ? "?" : poi.name) << "]";
            }
            logStream << "\n";
        }
    }

    logStream << "Processed " << inputFiles.size() << " files, " << failures << " failed\n";
    return 0;
}
