#pragma once

#include <vector>
#include "structures.hpp"
#include "geometry.hpp"

// ==================== Merge phase ====================

// Merge clusters smaller than config.minPoisPerZone into their nearest
// neighbour (centroid to centroid), provided the result stays within
// config.maxPoisPerZone and the centroids are at most
// 3 * config.clusterRadiusMeters apart. Restarts the scan after every
// merge and stops after a pass with no merge. Clusters without a legal
// partner are left undersized.
std::vector<Cluster> mergeSmallClusters(std::vector<Cluster> clusters,
                                        const std::vector<Coordinate>& points,
                                        const ZoneConfig& config);
