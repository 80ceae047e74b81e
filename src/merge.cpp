#include "merge.hpp"
#include "debug.hpp"

#include <limits>
#include <vector>

std::vector<Cluster> mergeSmallClusters(std::vector<Cluster> clusters,
                                        const std::vector<Coordinate>& points,
                                        const ZoneConfig& config) {
    if (clusters.size() <= 1) return clusters;

    // Don't merge across gaps much wider than the clustering radius
    const double maxMergeDistance = config.clusterRadiusMeters * 3;

    size_t mergeCount = 0;
    bool changed = true;
    while (changed) {
        changed = false;

        std::vector<Coordinate> centroids;
        centroids.reserve(clusters.size());
        for (const auto& c : clusters) {
            centroids.push_back(clusterCentroid(c, points));
        }

        for (size_t i = 0; i < clusters.size(); ++i) {
            if (clusters[i].size() >= config.minPoisPerZone) continue;

            size_t best = static_cast<size_t>(-1);
            double bestDist = std::numeric_limits<double>::infinity();
            for (size_t j = 0; j < clusters.size(); ++j) {
                if (i == j) continue;
                if (clusters[i].size() + clusters[j].size() > config.maxPoisPerZone) continue;

                double d = haversineDistance(centroids[i], centroids[j]);
                if (d < bestDist && d <= maxMergeDistance) {
                    bestDist = d;
                    best = j;
                }
            }

            if (best == static_cast<size_t>(-1)) {
                DBG("Cluster " << i << " (size " << clusters[i].size() << ") has no merge partner");
                continue;
            }

            ++mergeCount;
            DBG("Merge #" << mergeCount << ": " << best << " into " << i
                << " (dist=" << bestDist << ")");

            // Partner's members go after the small cluster's own
            clusters[i].insert(clusters[i].end(), clusters[best].begin(), clusters[best].end());
            clusters.erase(clusters.begin() + best);
            changed = true;
            break; // positions have shifted, rescan
        }
    }

    DBG("Merge complete. " << mergeCount << " merges, " << clusters.size() << " clusters left");
    return clusters;
}
