#pragma once

#include <functional>
#include <optional>
#include <vector>

#include "structures.hpp"
#include "geometry.hpp"

// Function signatures
bool verifyZones(const std::vector<Zone>& zones, size_t numPois, const ZoneConfig& config);

std::vector<Zone> planZones(const std::vector<Coordinate>& pois, const ZoneConfig& config = ZoneConfig());

std::optional<Bounds> calculateOverallBounds(const std::vector<Zone>& zones);

// Any record with lat/lng members. Only the coordinates are read; zones
// refer back to the records by index.
template<typename POI>
std::vector<Zone> planZones(const std::vector<POI>& pois, const ZoneConfig& config = ZoneConfig()) {
    std::vector<Coordinate> coords;
    coords.reserve(pois.size());
    for (const auto& p : pois) {
        coords.push_back({p.lat, p.lng});
    }
    return planZones(coords, config);
}

// The caller's own records for one zone, in the zone's index order.
// Valid as long as pois is neither destroyed nor resized.
template<typename POI>
std::vector<std::reference_wrapper<const POI>> getZonePOIs(const std::vector<POI>& pois, const Zone& zone) {
    std::vector<std::reference_wrapper<const POI>> result;
    result.reserve(zone.poiIndices.size());
    for (size_t i : zone.poiIndices) {
        result.push_back(std::cref(pois[i]));
    }
    return result;
}
