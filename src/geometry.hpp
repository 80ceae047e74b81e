#pragma once

#include <vector>
#include <boost/geometry.hpp>

#include "structures.hpp"

namespace bg = boost::geometry;

constexpr double EARTH_RADIUS_METERS = 6371000.0;

// ==================== Geometry helpers ====================

// Great-circle (haversine) distance in meters
double haversineDistance(const Coordinate& a, const Coordinate& b);

// Arithmetic mean of the member coordinates, not a geodesic centroid
Coordinate clusterCentroid(const Cluster& cluster, const std::vector<Coordinate>& points);

// ==================== Map view helpers ====================

// Min/max lat and lng over all points. No antimeridian handling.
Bounds calculateBounds(const std::vector<Coordinate>& points);

// Midpoint of the box
Coordinate calculateCenter(const Bounds& bounds);

// Largest Web-Mercator zoom level (256px tiles) at which the box fits
// inside the viewport, clamped to [0, 18].
double calculateZoom(const Bounds& bounds, const MapSize& mapSize);
