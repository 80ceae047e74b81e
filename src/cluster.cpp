#include "cluster.hpp"
#include "geometry.hpp"
#include "debug.hpp"

#include <algorithm>
#include <numeric>
#include <utility>
#include <vector>

std::vector<Cluster> clusterPOIs(const std::vector<Coordinate>& points,
                                 double radiusMeters, size_t maxSize) {
    size_t n = points.size();
    std::vector<Cluster> clusters;
    if (n == 0) return clusters;

    // North to south; stable so equal latitudes keep input order
    std::vector<size_t> order(n);
    std::iota(order.begin(), order.end(), 0);
    std::stable_sort(order.begin(), order.end(), [&](size_t a, size_t b) {
        return points[a].lat > points[b].lat;
    });

    std::vector<bool> assigned(n, false);
    std::vector<std::pair<double, size_t>> candidates;
    candidates.reserve(n);

    for (size_t seed : order) {
        if (assigned[seed]) continue;

        Cluster cluster{seed};
        assigned[seed] = true;

        // Unassigned points within the radius of the seed
        candidates.clear();
        for (size_t id : order) {
            if (assigned[id]) continue;
            double d = haversineDistance(points[seed], points[id]);
            if (d <= radiusMeters) {
                candidates.emplace_back(d, id);
            }
        }

        // Nearest first, up to the size cap
        std::stable_sort(candidates.begin(), candidates.end(),
            [](const auto& a, const auto& b) { return a.first < b.first; });
        for (const auto& c : candidates) {
            if (cluster.size() >= maxSize) break;
            cluster.push_back(c.second);
            assigned[c.second] = true;
        }

        DBG("Seed " << seed << ": " << candidates.size() << " candidates within "
            << radiusMeters << " m, cluster size " << cluster.size());
        clusters.push_back(std::move(cluster));
    }

    DBG("Clustering produced " << clusters.size() << " clusters from " << n << " points");
    return clusters;
}
