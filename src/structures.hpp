#pragma once

#include <cstddef>
#include <string>
#include <unordered_set>
#include <vector>
#include <absl/container/flat_hash_set.h>
#include <boost/geometry.hpp>
#include <boost/geometry/geometries/register/point.hpp>

// Choose Abseil or std hash set
#if USE_ABSEIL_HASH_SET
template<typename T>
using HashSet = absl::flat_hash_set<T>;
#else
template<typename T>
using HashSet = std::unordered_set<T>;
#endif

namespace bg = boost::geometry;

// ==================== Structures ====================

// Geographic coordinate in degrees.
struct Coordinate {
    double lat;
    double lng;
};

// Boost.Geometry sees a Coordinate as (x = lng, y = lat) on the sphere,
// so bg::distance with a haversine strategy works on it directly.
BOOST_GEOMETRY_REGISTER_POINT_2D(Coordinate, double,
                                 boost::geometry::cs::spherical_equatorial<boost::geometry::degree>,
                                 lng, lat)

// Axis-aligned box in degrees. north >= south; east/west are not wrapped.
struct Bounds {
    double north;
    double south;
    double east;
    double west;
};

// Viewport in pixels, only used by the zoom calculation.
struct MapSize {
    double width = 400;
    double height = 600;
};

struct ZoneConfig {
    size_t minPoisPerZone = 3; // soft target, may be violated
    size_t maxPoisPerZone = 10; // hard bound
    double clusterRadiusMeters = 1000.0;
    MapSize mapSize;
};

// Indices into the caller's POI array
typedef std::vector<size_t> Cluster;

struct Zone {
    std::string id;
    Cluster poiIndices;
    Bounds bounds;
    Coordinate center;
    double zoom;
};
