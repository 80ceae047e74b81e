#pragma once

#include <vector>
#include "structures.hpp"

// ==================== Clustering phase ====================

// Greedy proximity clustering. Seeds are taken north to south; each seed
// absorbs the nearest unassigned points within radiusMeters until the
// cluster holds maxSize points. Every index in [0, points.size()) ends up
// in exactly one cluster.
std::vector<Cluster> clusterPOIs(const std::vector<Coordinate>& points,
                                 double radiusMeters, size_t maxSize);
