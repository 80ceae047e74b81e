#include "io.hpp"
#include "ZonePlanner.hpp"
#include "parse.hpp"

#include <cctype>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <utility>

std::vector<POI> readPOIs(std::istream& in) {
    std::vector<POI> pois;
    std::string line;
    while (std::getline(in, line)) {
        std::istringstream iss(line);
        std::string latToken, lngToken;
        POI poi;
        if (!(iss >> latToken >> lngToken)) continue; // blank or too short
        if (!parseNumber(latToken, poi.lat) || !parseNumber(lngToken, poi.lng)) continue; // comment or junk

        std::getline(iss >> std::ws, poi.name);
        while (!poi.name.empty() && std::isspace(static_cast<unsigned char>(poi.name.back()))) {
            poi.name.pop_back();
        }
        pois.push_back(std::move(poi));
    }
    return pois;
}

std::vector<POI> readPOIFile(const std::string& filename) {
    std::ifstream infile(filename);
    if (!infile) throw std::runtime_error("Cannot open file: " + filename);
    return readPOIs(infile);
}

// zones <k>
// overall <north> <south> <east> <west>                      (only if k > 0)
// <id> <north> <south> <east> <west> <lat> <lng> <zoom> : <idx>...
void writeZones(std::ostream& out, const std::vector<Zone>& zones) {
    out << std::fixed << std::setprecision(6);
    out << "zones " << zones.size() << "\n";

    if (auto overall = calculateOverallBounds(zones)) {
        out << "overall " << overall->north << " " << overall->south << " "
            << overall->east << " " << overall->west << "\n";
    }

    for (const auto& zone : zones) {
        out << zone.id << " "
            << zone.bounds.north << " " << zone.bounds.south << " "
            << zone.bounds.east << " " << zone.bounds.west << " "
            << zone.center.lat << " " << zone.center.lng << " "
            << zone.zoom << " :";
        for (size_t i : zone.poiIndices) {
            out << " " << i;
        }
        out << "\n";
    }
}
