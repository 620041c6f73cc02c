// File: clustering/clusterer.hpp

#ifndef CLUSTERER_HPP
#define CLUSTERER_HPP

#include <Eigen/Dense>
#include <cstdint>
#include <string>
#include <vector>

#include "clustering/kmeans.hpp"
#include "common/logging/logger.hpp"
#include "types/cluster.hpp"

namespace clustering {

    struct ClustererOptions {
        std::uint64_t seed = 42;
        KMeansOptions kmeans;
        // Centroids are ordered ascending on this feature column.
        std::string canonical_feature = "oer";
    };

    struct ClusteringResult {
        ClusterModel model;
        std::vector<ClusterAssignment> assignments; // Same row order as the scaled matrix.
    };

    /*
     * Fits the production K-Means model and publishes canonical labels: label 0 is the centroid
     * with the lowest canonical feature value, so the numbering never depends on the seed.
     */
    class Clusterer {
    public:
        explicit Clusterer(ClustererOptions options = {});

        [[nodiscard]] ClusteringResult fit(const Eigen::MatrixXd &scaled, const std::vector<std::string> &player_ids,
                                           int k) const;

        // Canonical K-Means fit with an explicit seed; the stability runs go through here.
        [[nodiscard]] KMeansResult<double> fitCanonical(const Eigen::MatrixXd &scaled, int k,
                                                        std::uint64_t seed) const;

        [[nodiscard]] Eigen::Index canonicalColumn() const noexcept { return canonical_column_; }

    private:
        ClustererOptions options_;
        Eigen::Index canonical_column_;
    };

} // namespace clustering

#endif // CLUSTERER_HPP
