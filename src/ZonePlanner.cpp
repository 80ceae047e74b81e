#include "ZonePlanner.hpp"
#include "cluster.hpp"
#include "merge.hpp"
#include "zones.hpp"
#include "debug.hpp"

#include <limits>
#include <string>
#include <utility>
#include <vector>

// Verify that the zones partition [0, numPois) and respect the size cap
bool verifyZones(const std::vector<Zone>& zones, size_t numPois, const ZoneConfig& config) {
    HashSet<size_t> seen;
    for (size_t z = 0; z < zones.size(); ++z) {
        const Zone& zone = zones[z];
        if (zone.id != "zone-" + std::to_string(z)) {
            DBG("Zone at position " << z << " has id " << zone.id);
            return false;
        }
        if (zone.poiIndices.empty() || zone.poiIndices.size() > config.maxPoisPerZone) {
            DBG(zone.id << " has " << zone.poiIndices.size() << " POIs (max "
                << config.maxPoisPerZone << ")");
            return false;
        }
        for (size_t i : zone.poiIndices) {
            if (i >= numPois) {
                DBG(zone.id << " refers to POI " << i << " out of " << numPois);
                return false;
            }
            if (!seen.insert(i).second) {
                DBG("POI " << i << " appears in more than one place (again in " << zone.id << ")");
                return false;
            }
        }
    }

    if (seen.size() != numPois) {
        DBG("Only " << seen.size() << " of " << numPois << " POIs are assigned to a zone");
        return false;
    }
    return true;
}

std::vector<Zone> planZones(const std::vector<Coordinate>& pois, const ZoneConfig& config) {
    if (pois.empty()) return {};

    // Step 1: Greedy clustering around north-most unassigned seeds
    std::vector<Cluster> clusters = clusterPOIs(pois, config.clusterRadiusMeters, config.maxPoisPerZone);

    // Step 2: Fold undersized clusters into nearby ones
    clusters = mergeSmallClusters(std::move(clusters), pois, config);

    // Step 3: Bounds, center and zoom per cluster
    std::vector<Zone> zones;
    zones.reserve(clusters.size());
    for (size_t i = 0; i < clusters.size(); ++i) {
        DBG_INDICES("Cluster " << i, clusters[i]);
        zones.push_back(buildZone(std::move(clusters[i]), pois, config.mapSize, i));
    }

    // Step 4: Reading order and final ids
    orderZones(zones);
    return zones;
}

std::optional<Bounds> calculateOverallBounds(const std::vector<Zone>& zones) {
    if (zones.empty()) return std::nullopt;

    const double inf = std::numeric_limits<double>::infinity();
    Bounds overall{-inf, inf, -inf, inf};
    for (const auto& zone : zones) {
        if (zone.bounds.north > overall.north) overall.north = zone.bounds.north;
        if (zone.bounds.south < overall.south) overall.south = zone.bounds.south;
        if (zone.bounds.east > overall.east) overall.east = zone.bounds.east;
        if (zone.bounds.west < overall.west) overall.west = zone.bounds.west;
    }
    return overall;
}
