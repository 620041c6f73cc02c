// File: clustering/kmeans.hpp

#ifndef KMEANS_HPP
#define KMEANS_HPP

#include <Eigen/Dense>
#include <algorithm>
#include <cstdint>
#include <limits>
#include <numeric>
#include <random>
#include <stdexcept>
#include <utility>
#include <vector>

#include "common/logging/logger.hpp"
#include "types/concepts.hpp"

namespace clustering {

    struct KMeansOptions {
        int max_iterations = 300;
        int restarts = 10;
    };

    template<FloatingPoint T = double>
    struct KMeansResult {
        Eigen::Matrix<T, Eigen::Dynamic, Eigen::Dynamic> centroids; // k x d
        std::vector<int> labels;
        Eigen::Matrix<T, Eigen::Dynamic, 1> distances; // Euclidean distance of each point to its centroid.
        T inertia = 0;
        int iterations = 0;
        bool converged = false;
        std::uint64_t seed = 0;
    };

    /*
     * Lloyd's K-Means with k-means++ seeding. Each fit runs `restarts` independent initializations
     * whose seeds are drawn from the run seed, and keeps the one with the lowest inertia. Identical
     * data and seed always give identical centroids and labels.
     */
    template<FloatingPoint T = double, SeededEngine Engine = std::mt19937_64>
    class KMeans {
    public:
        using Matrix = Eigen::Matrix<T, Eigen::Dynamic, Eigen::Dynamic>;
        using Vector = Eigen::Matrix<T, Eigen::Dynamic, 1>;

        explicit KMeans(int k, KMeansOptions options = {});

        [[nodiscard]] KMeansResult<T> fit(const Matrix &data, std::uint64_t seed) const;

        // Nearest centroid per row; ties go to the lower centroid index.
        static std::vector<int> assign(const Matrix &data, const Matrix &centroids, Vector *squared_distances = nullptr);

        // Orders centroids ascending on key_column, ties broken lexicographically on the
        // remaining columns, and renumbers the labels to match.
        static void canonicalize(KMeansResult<T> &result, Eigen::Index key_column);

        // Moves every empty cluster's centroid onto the point farthest from its own centroid,
        // using each point at most once.
        static void reseedEmpty(const Matrix &data, const std::vector<int> &labels,
                                const std::vector<Eigen::Index> &counts, Matrix &centroids);

    private:
        int k_;
        KMeansOptions options_;

        KMeansResult<T> fitOnce(const Matrix &data, std::uint64_t seed) const;

        Matrix seedCentroids(const Matrix &data, Engine &engine) const;

        static Matrix pairwiseSquaredDistances(const Matrix &data, const Matrix &centroids);
    };

    template<FloatingPoint T, SeededEngine Engine>
    KMeans<T, Engine>::KMeans(const int k, KMeansOptions options) : k_(k), options_(options) {
        if (k_ < 1) {
            throw std::invalid_argument("K-Means needs at least one cluster.");
        }
        if (options_.max_iterations < 1 || options_.restarts < 1) {
            throw std::invalid_argument("K-Means iteration cap and restart count must be positive.");
        }
    }

    template<FloatingPoint T, SeededEngine Engine>
    KMeansResult<T> KMeans<T, Engine>::fit(const Matrix &data, const std::uint64_t seed) const {
        if (data.rows() < k_) {
            LOG_ERROR("Cannot fit {} clusters on {} points", k_, data.rows());
            throw std::invalid_argument("K-Means needs at least as many points as clusters.");
        }
        if (!data.allFinite()) {
            throw std::invalid_argument("K-Means input contains non-finite values.");
        }

        Engine seeder(seed);
        KMeansResult<T> best;
        best.inertia = std::numeric_limits<T>::infinity();

        for (int restart = 0; restart < options_.restarts; ++restart) {
            const auto restart_seed = static_cast<std::uint64_t>(seeder());
            auto candidate = fitOnce(data, restart_seed);
            LOG_TRACE("K={} restart {} (seed {}): inertia {:.4f} after {} iterations", k_, restart, restart_seed,
                      candidate.inertia, candidate.iterations);
            if (candidate.inertia < best.inertia) {
                best = std::move(candidate);
            }
        }

        best.seed = seed;
        if (!best.converged) {
            LOG_WARN("K-Means with K={} (seed {}) hit the iteration cap of {} without converging", k_, seed,
                     options_.max_iterations);
        }
        return best;
    }

    template<FloatingPoint T, SeededEngine Engine>
    KMeansResult<T> KMeans<T, Engine>::fitOnce(const Matrix &data, const std::uint64_t seed) const {
        Engine engine(seed);
        KMeansResult<T> result;
        result.seed = seed;
        result.centroids = seedCentroids(data, engine);
        result.labels = assign(data, result.centroids);

        const auto d = data.cols();
        std::vector<Eigen::Index> counts(static_cast<std::size_t>(k_));

        for (int iteration = 1; iteration <= options_.max_iterations; ++iteration) {
            Matrix sums = Matrix::Zero(k_, d);
            std::fill(counts.begin(), counts.end(), 0);
            for (Eigen::Index i = 0; i < data.rows(); ++i) {
                const int label = result.labels[static_cast<std::size_t>(i)];
                sums.row(label) += data.row(i);
                ++counts[static_cast<std::size_t>(label)];
            }
            for (int c = 0; c < k_; ++c) {
                if (counts[static_cast<std::size_t>(c)] > 0) {
                    result.centroids.row(c) = sums.row(c) / static_cast<T>(counts[static_cast<std::size_t>(c)]);
                }
            }
            reseedEmpty(data, result.labels, counts, result.centroids);

            auto labels = assign(data, result.centroids);
            result.iterations = iteration;
            if (labels == result.labels) {
                result.converged = true;
                break;
            }
            result.labels = std::move(labels);
        }

        Vector squared;
        result.labels = assign(data, result.centroids, &squared);
        result.inertia = squared.sum();
        result.distances = squared.cwiseSqrt();
        return result;
    }

    template<FloatingPoint T, SeededEngine Engine>
    typename KMeans<T, Engine>::Matrix KMeans<T, Engine>::seedCentroids(const Matrix &data, Engine &engine) const {
        const auto n = data.rows();
        Matrix centroids(k_, data.cols());

        std::uniform_int_distribution<Eigen::Index> uniform_index(0, n - 1);
        centroids.row(0) = data.row(uniform_index(engine));
        Vector min_distance = (data.rowwise() - centroids.row(0)).rowwise().squaredNorm();

        for (int c = 1; c < k_; ++c) {
            const T total = min_distance.sum();
            Eigen::Index chosen = 0;
            if (total > 0) {
                // D^2 weighting: points far from every chosen centroid are proportionally more likely.
                std::uniform_real_distribution<T> uniform(0, total);
                T target = uniform(engine);
                for (chosen = 0; chosen < n - 1; ++chosen) {
                    target -= min_distance(chosen);
                    if (target < 0) {
                        break;
                    }
                }
            } else {
                chosen = uniform_index(engine);
            }

            centroids.row(c) = data.row(chosen);
            min_distance = min_distance.cwiseMin((data.rowwise() - centroids.row(c)).rowwise().squaredNorm());
        }
        return centroids;
    }

    template<FloatingPoint T, SeededEngine Engine>
    void KMeans<T, Engine>::reseedEmpty(const Matrix &data, const std::vector<int> &labels,
                                        const std::vector<Eigen::Index> &counts, Matrix &centroids) {
        if (std::find(counts.begin(), counts.end(), 0) == counts.end()) {
            return;
        }

        Vector distance_to_own(data.rows());
        for (Eigen::Index i = 0; i < data.rows(); ++i) {
            distance_to_own(i) = (data.row(i) - centroids.row(labels[static_cast<std::size_t>(i)])).squaredNorm();
        }

        for (std::size_t c = 0; c < counts.size(); ++c) {
            if (counts[c] != 0) {
                continue;
            }
            Eigen::Index farthest = 0;
            distance_to_own.maxCoeff(&farthest);
            centroids.row(static_cast<Eigen::Index>(c)) = data.row(farthest);
            distance_to_own(farthest) = -1; // Never reuse the same point for a second empty cluster.
            LOG_DEBUG("Empty cluster {} reseeded with point {}", c, farthest);
        }
    }

    template<FloatingPoint T, SeededEngine Engine>
    typename KMeans<T, Engine>::Matrix KMeans<T, Engine>::pairwiseSquaredDistances(const Matrix &data,
                                                                                   const Matrix &centroids) {
        Matrix distances(data.rows(), centroids.rows());
        for (Eigen::Index c = 0; c < centroids.rows(); ++c) {
            distances.col(c) = (data.rowwise() - centroids.row(c)).rowwise().squaredNorm();
        }
        return distances;
    }

    template<FloatingPoint T, SeededEngine Engine>
    std::vector<int> KMeans<T, Engine>::assign(const Matrix &data, const Matrix &centroids,
                                               Vector *squared_distances) {
        if (data.cols() != centroids.cols()) {
            throw std::invalid_argument("Data and centroids differ in dimensionality.");
        }

        const Matrix distances = pairwiseSquaredDistances(data, centroids);
        std::vector<int> labels(static_cast<std::size_t>(data.rows()));
        if (squared_distances) {
            squared_distances->resize(data.rows());
        }

        for (Eigen::Index i = 0; i < data.rows(); ++i) {
            Eigen::Index nearest = 0;
            const T best = distances.row(i).minCoeff(&nearest);
            labels[static_cast<std::size_t>(i)] = static_cast<int>(nearest);
            if (squared_distances) {
                (*squared_distances)(i) = best;
            }
        }
        return labels;
    }

    template<FloatingPoint T, SeededEngine Engine>
    void KMeans<T, Engine>::canonicalize(KMeansResult<T> &result, const Eigen::Index key_column) {
        const auto &centroids = result.centroids;
        if (key_column < 0 || key_column >= centroids.cols()) {
            throw std::out_of_range("Canonical key column is outside the centroid dimensionality.");
        }

        std::vector<Eigen::Index> order(static_cast<std::size_t>(centroids.rows()));
        std::iota(order.begin(), order.end(), 0);
        std::sort(order.begin(), order.end(), [&centroids, key_column](const Eigen::Index a, const Eigen::Index b) {
            if (centroids(a, key_column) != centroids(b, key_column)) {
                return centroids(a, key_column) < centroids(b, key_column);
            }
            for (Eigen::Index j = 0; j < centroids.cols(); ++j) {
                if (j != key_column && centroids(a, j) != centroids(b, j)) {
                    return centroids(a, j) < centroids(b, j);
                }
            }
            return a < b;
        });

        Matrix reordered(centroids.rows(), centroids.cols());
        std::vector<int> relabel(order.size());
        for (std::size_t rank = 0; rank < order.size(); ++rank) {
            reordered.row(static_cast<Eigen::Index>(rank)) = centroids.row(order[rank]);
            relabel[static_cast<std::size_t>(order[rank])] = static_cast<int>(rank);
        }

        result.centroids = std::move(reordered);
        for (auto &label: result.labels) {
            label = relabel[static_cast<std::size_t>(label)];
        }
    }

} // namespace clustering

#endif // KMEANS_HPP
