#include "zones.hpp"
#include "debug.hpp"

#include <algorithm>
#include <cmath>
#include <string>
#include <utility>
#include <vector>

Zone buildZone(Cluster cluster, const std::vector<Coordinate>& points,
               const MapSize& mapSize, size_t position) {
    std::vector<Coordinate> members;
    members.reserve(cluster.size());
    for (size_t i : cluster) {
        members.push_back(points[i]);
    }

    Zone zone;
    zone.id = "zone-" + std::to_string(position);
    zone.poiIndices = std::move(cluster);
    zone.bounds = calculateBounds(members);
    zone.center = calculateCenter(zone.bounds);
    zone.zoom = calculateZoom(zone.bounds, mapSize);
    return zone;
}

void orderZones(std::vector<Zone>& zones) {
    // Not a strict weak ordering: rows chained within SAME_ROW_TOLERANCE of
    // each other are not transitive ([alg.sorting]). libstdc++'s stable_sort
    // stays in range and gives a fixed permutation for a given input order.
    std::stable_sort(zones.begin(), zones.end(), [](const Zone& a, const Zone& b) {
        if (std::abs(a.bounds.north - b.bounds.north) > SAME_ROW_TOLERANCE) {
            return a.bounds.north > b.bounds.north;
        }
        return a.bounds.west < b.bounds.west;
    });

    for (size_t i = 0; i < zones.size(); ++i) {
        zones[i].id = "zone-" + std::to_string(i);
        DBG(zones[i].id << ": " << zones[i].poiIndices.size() << " POIs, north="
            << zones[i].bounds.north << " west=" << zones[i].bounds.west
            << " zoom=" << zones[i].zoom);
    }
}
