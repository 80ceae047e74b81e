#pragma once

#include <vector>
#include "structures.hpp"
#include "geometry.hpp"

// Rows closer than this (degrees of north edge) are read west to east
constexpr double SAME_ROW_TOLERANCE = 0.01;

// ==================== Zone construction ====================

// Attach bounds, center and zoom to a cluster. The id is a placeholder
// ("zone-<position>") until orderZones renumbers it.
Zone buildZone(Cluster cluster, const std::vector<Coordinate>& points,
               const MapSize& mapSize, size_t position);

// Sort north to south, west to east within a row, then renumber ids
// zone-0 .. zone-(k-1) in final order.
void orderZones(std::vector<Zone>& zones);
