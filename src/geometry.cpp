#include "geometry.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <numbers>

namespace {

constexpr double TILE_SIZE = 256.0;
constexpr double MIN_ZOOM = 0.0;
constexpr double MAX_ZOOM = 18.0;

// Mercator y of a latitude, clamped to [-pi/2, pi/2]
double mercatorLat(double lat) {
    double s = std::sin(lat * std::numbers::pi / 180.0);
    double radX2 = std::log((1 + s) / (1 - s)) / 2;
    return std::max(std::min(radX2, std::numbers::pi), -std::numbers::pi) / 2;
}

double zoomFor(double mapPx, double fraction) {
    return std::floor(std::log2(mapPx / TILE_SIZE / fraction));
}

}

double haversineDistance(const Coordinate& a, const Coordinate& b) {
    auto toRad = [](double deg) { return (deg * std::numbers::pi) / 180; };
    double lat1 = bg::get<1>(a), lng1 = bg::get<0>(a);
    double lat2 = bg::get<1>(b), lng2 = bg::get<0>(b);

    // Differences are taken in degrees before converting, so points mirrored
    // across the same meridian come out exactly equidistant.
    double dLat = toRad(lat2 - lat1);
    double dLng = toRad(lng2 - lng1);

    double h = std::sin(dLat / 2) * std::sin(dLat / 2)
             + std::cos(toRad(lat1)) * std::cos(toRad(lat2))
             * std::sin(dLng / 2) * std::sin(dLng / 2);
    return EARTH_RADIUS_METERS * 2 * std::atan2(std::sqrt(h), std::sqrt(1 - h));
}

Coordinate clusterCentroid(const Cluster& cluster, const std::vector<Coordinate>& points) {
    double sumLat = 0.0, sumLng = 0.0;
    for (size_t i : cluster) {
        sumLat += points[i].lat;
        sumLng += points[i].lng;
    }
    double n = static_cast<double>(cluster.size());
    return {sumLat / n, sumLng / n};
}

Bounds calculateBounds(const std::vector<Coordinate>& points) {
    const double inf = std::numeric_limits<double>::infinity();
    Bounds b{-inf, inf, -inf, inf};
    for (const auto& p : points) {
        if (p.lat > b.north) b.north = p.lat;
        if (p.lat < b.south) b.south = p.lat;
        if (p.lng > b.east) b.east = p.lng;
        if (p.lng < b.west) b.west = p.lng;
    }
    return b;
}

Coordinate calculateCenter(const Bounds& bounds) {
    return {(bounds.north + bounds.south) / 2.0, (bounds.east + bounds.west) / 2.0};
}

double calculateZoom(const Bounds& bounds, const MapSize& mapSize) {
    double latFraction = (mercatorLat(bounds.north) - mercatorLat(bounds.south)) / std::numbers::pi;
    double lngFraction = (bounds.east - bounds.west) / 360.0;
    if (std::isnan(latFraction) || std::isnan(lngFraction)) {
        return std::numeric_limits<double>::quiet_NaN();
    }

    // A zero span on an axis puts no limit on the zoom
    double latZoom = latFraction > 0 ? zoomFor(mapSize.height, latFraction) : MAX_ZOOM;
    double lngZoom = lngFraction > 0 ? zoomFor(mapSize.width, lngFraction) : MAX_ZOOM;
    return std::clamp(std::min(latZoom, lngZoom), MIN_ZOOM, MAX_ZOOM);
}
