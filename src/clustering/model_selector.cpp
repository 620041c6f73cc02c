// File: clustering/model_selector.cpp

#include "clustering/model_selector.hpp"

#include <algorithm>
#include <exception>
#include <execution>
#include <numeric>
#include <stdexcept>
#include <vector>

#include <fmt/format.h>

#include "clustering/silhouette.hpp"

namespace clustering {

    ModelSelector::ModelSelector(SelectionOptions options) : options_(options) {
        if (options_.k_min < 2) {
            throw std::invalid_argument("Smallest candidate K must be at least 2.");
        }
        if (options_.k_max < options_.k_min) {
            throw std::invalid_argument(
                    fmt::format("Candidate K range [{}, {}] is empty.", options_.k_min, options_.k_max));
        }
    }

    Eigen::Index ModelSelector::distinctRows(const Eigen::MatrixXd &matrix) {
        if (matrix.rows() == 0) {
            return 0;
        }

        std::vector<Eigen::Index> order(static_cast<std::size_t>(matrix.rows()));
        std::iota(order.begin(), order.end(), 0);
        const auto less = [&matrix](const Eigen::Index a, const Eigen::Index b) {
            for (Eigen::Index j = 0; j < matrix.cols(); ++j) {
                if (matrix(a, j) != matrix(b, j)) {
                    return matrix(a, j) < matrix(b, j);
                }
            }
            return false;
        };
        std::sort(order.begin(), order.end(), less);

        Eigen::Index distinct = 1;
        for (std::size_t i = 1; i < order.size(); ++i) {
            if (less(order[i - 1], order[i])) {
                ++distinct;
            }
        }
        return distinct;
    }

    CandidateScore ModelSelector::evaluate(const Eigen::MatrixXd &scaled, const int k) const {
        const KMeans<double> kmeans(k, options_.kmeans);
        const auto result = kmeans.fit(scaled, options_.seed);

        CandidateScore score;
        score.k = k;
        score.silhouette = Silhouette::score(scaled, result.labels);
        score.inertia = result.inertia;
        score.converged = result.converged;
        LOG_DEBUG("Candidate K={}: silhouette {:.4f}, inertia {:.4f}, {} iterations", k, score.silhouette,
                  score.inertia, result.iterations);
        return score;
    }

    ModelSelection ModelSelector::select(const Eigen::MatrixXd &scaled) const {
        const auto n = scaled.rows();
        if (n == 0) {
            LOG_ERROR("Model selection received an empty population");
            throw errors::DegenerateInputError("Cannot select a cluster count for an empty population.");
        }

        if (!scaled.allFinite()) {
            LOG_ERROR("Model selection input contains non-finite values");
            throw std::invalid_argument("Model selection input contains non-finite values.");
        }

        const auto distinct = distinctRows(scaled);
        if (distinct < options_.k_min) {
            LOG_ERROR("Only {} distinct players for a smallest candidate K of {}", distinct, options_.k_min);
            throw errors::DegenerateInputError(fmt::format(
                    "Population has {} distinct feature rows, fewer than the smallest candidate K of {}.", distinct,
                    options_.k_min));
        }

        // Silhouette needs a second cluster to compare against, hence K <= n - 1.
        const auto k_cap = static_cast<int>(std::min<Eigen::Index>(n - 1, distinct));
        int k_max = options_.k_max;
        if (k_max > k_cap) {
            LOG_WARN("Largest candidate K capped from {} to {} for {} players ({} distinct)", k_max, k_cap, n,
                     distinct);
            k_max = k_cap;
        }
        if (k_max < options_.k_min) {
            LOG_ERROR("No candidate K left in [{}, {}] for {} players", options_.k_min, k_max, n);
            throw errors::DegenerateInputError(
                    fmt::format("Population of {} players cannot support K = {}.", n, options_.k_min));
        }

        std::vector<int> ks(static_cast<std::size_t>(k_max - options_.k_min + 1));
        std::iota(ks.begin(), ks.end(), options_.k_min);

        ModelSelection selection;
        selection.candidates.resize(ks.size());
        std::vector<std::exception_ptr> failures(ks.size());
        std::vector<std::size_t> slots(ks.size());
        std::iota(slots.begin(), slots.end(), 0);
        std::for_each(std::execution::par, slots.begin(), slots.end(), [&](const std::size_t slot) {
            try {
                selection.candidates[slot] = evaluate(scaled, ks[slot]);
            } catch (...) {
                failures[slot] = std::current_exception();
            }
        });
        for (const auto &failure: failures) {
            if (failure) {
                std::rethrow_exception(failure);
            }
        }

        const CandidateScore *best = &selection.candidates.front();
        for (const auto &candidate: selection.candidates) {
            if (candidate.silhouette > best->silhouette) {
                best = &candidate;
            }
        }

        selection.selected_k = best->k;
        selection.selected_silhouette = best->silhouette;
        selection.acceptable = best->silhouette >= options_.min_acceptable_silhouette;

        LOG_INFO("Selected K={} with silhouette {:.4f} out of {} candidates", selection.selected_k,
                 selection.selected_silhouette, selection.candidates.size());
        if (!selection.acceptable) {
            LOG_WARN("Best silhouette {:.4f} is below the acceptable minimum {:.4f}; clusters are weakly separated",
                     selection.selected_silhouette, options_.min_acceptable_silhouette);
        }
        return selection;
    }

} // namespace clustering
