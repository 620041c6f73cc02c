// File: types/cluster.hpp

#ifndef CLUSTER_HPP
#define CLUSTER_HPP

#include <Eigen/Dense>
#include <cmath>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

#include "types/feature_vector.hpp"

struct ClusterAssignment {
    std::string player_id;
    int label = -1;
    double distance = 0.0; // Euclidean distance to the assigned centroid, in scaled space.
};

struct Prediction {
    int label = -1;
    double distance = 0.0;
};

/*
 * Final fitted model: K centroids in scaled feature space, stored in canonical order so that
 * label i always refers to centroid row i.
 */
struct ClusterModel {
    int k = 0;
    Eigen::MatrixXd centroids;
    double silhouette = 0.0;
    double inertia = 0.0;
    int iterations = 0;
    bool converged = false; // false records a ConvergenceWarning: the iteration cap was reached.
    std::vector<int> cluster_sizes;
    std::uint64_t seed = 0;
    std::string canonical_feature;

    // Nearest centroid for an already-scaled feature row.
    [[nodiscard]] Prediction predict(const Eigen::Ref<const Eigen::RowVectorXd> &scaled) const {
        if (centroids.rows() == 0) {
            throw std::logic_error("ClusterModel has no centroids.");
        }
        if (scaled.size() != centroids.cols()) {
            throw std::invalid_argument("Scaled row dimensionality does not match the model centroids.");
        }
        Eigen::Index nearest = 0;
        const double squared = (centroids.rowwise() - scaled).rowwise().squaredNorm().minCoeff(&nearest);
        return {static_cast<int>(nearest), std::sqrt(squared)};
    }

    [[nodiscard]] Prediction predict(const ClusteringFeatures &scaled) const { return predict(scaled.toRow()); }
};

struct CandidateScore {
    int k = 0;
    double silhouette = 0.0;
    double inertia = 0.0;
    bool converged = false;
};

struct ModelSelection {
    std::vector<CandidateScore> candidates; // Ordered by K.
    int selected_k = 0;
    double selected_silhouette = 0.0;
    // False when even the best candidate stays below the configured silhouette bar.
    bool acceptable = false;
};

#endif // CLUSTER_HPP
