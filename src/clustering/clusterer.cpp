// File: clustering/clusterer.cpp

#include "clustering/clusterer.hpp"

#include <stdexcept>
#include <utility>

#include <fmt/format.h>

#include "clustering/silhouette.hpp"
#include "types/feature_vector.hpp"

namespace clustering {

    Clusterer::Clusterer(ClustererOptions options) : options_(std::move(options)) {
        const auto column = ClusteringFeatures::indexOf(options_.canonical_feature);
        if (!column) {
            LOG_ERROR("Unknown canonical feature '{}'", options_.canonical_feature);
            throw std::invalid_argument(
                    fmt::format("Canonical feature '{}' is not a clustering feature.", options_.canonical_feature));
        }
        canonical_column_ = static_cast<Eigen::Index>(*column);
    }

    KMeansResult<double> Clusterer::fitCanonical(const Eigen::MatrixXd &scaled, const int k,
                                                 const std::uint64_t seed) const {
        if (scaled.cols() <= canonical_column_) {
            throw std::invalid_argument(fmt::format("Scaled matrix has {} columns, canonical feature '{}' needs {}",
                                                    scaled.cols(), options_.canonical_feature,
                                                    canonical_column_ + 1));
        }
        const KMeans<double> kmeans(k, options_.kmeans);
        auto result = kmeans.fit(scaled, seed);
        KMeans<double>::canonicalize(result, canonical_column_);
        return result;
    }

    ClusteringResult Clusterer::fit(const Eigen::MatrixXd &scaled, const std::vector<std::string> &player_ids,
                                    const int k) const {
        if (static_cast<Eigen::Index>(player_ids.size()) != scaled.rows()) {
            throw std::invalid_argument("Clusterer needs exactly one player identifier per row.");
        }

        auto fitted = fitCanonical(scaled, k, options_.seed);

        ClusteringResult result;
        auto &model = result.model;
        model.k = k;
        model.centroids = fitted.centroids;
        model.inertia = fitted.inertia;
        model.iterations = fitted.iterations;
        model.converged = fitted.converged;
        model.seed = fitted.seed;
        model.canonical_feature = options_.canonical_feature;
        model.cluster_sizes.assign(static_cast<std::size_t>(k), 0);
        for (const int label: fitted.labels) {
            ++model.cluster_sizes[static_cast<std::size_t>(label)];
        }
        model.silhouette = k >= 2 ? Silhouette::score(scaled, fitted.labels) : 0.0;

        result.assignments.reserve(player_ids.size());
        for (std::size_t i = 0; i < player_ids.size(); ++i) {
            result.assignments.push_back(
                    {player_ids[i], fitted.labels[i], fitted.distances(static_cast<Eigen::Index>(i))});
        }

        LOG_INFO("Final model: K={}, silhouette {:.4f}, inertia {:.4f}, {} iterations{}", k, model.silhouette,
                 model.inertia, model.iterations, model.converged ? "" : " (iteration cap reached)");
        LOG_DEBUG("Canonical centroids ({}):{:.3f}", model.canonical_feature, model.centroids);
        return result;
    }

} // namespace clustering
