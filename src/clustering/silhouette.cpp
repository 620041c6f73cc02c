// File: clustering/silhouette.cpp

#include "clustering/silhouette.hpp"

#include <algorithm>
#include <execution>
#include <limits>
#include <numeric>
#include <stdexcept>

#include "common/logging/logger.hpp"

namespace clustering {

    Eigen::VectorXd Silhouette::samples(const Eigen::MatrixXd &data, const std::vector<int> &labels) {
        if (static_cast<Eigen::Index>(labels.size()) != data.rows()) {
            throw std::invalid_argument("Silhouette needs exactly one label per row.");
        }
        if (labels.empty()) {
            throw std::invalid_argument("Silhouette of an empty dataset is undefined.");
        }
        if (*std::min_element(labels.begin(), labels.end()) < 0) {
            throw std::invalid_argument("Silhouette labels must be non-negative.");
        }

        const int k = *std::max_element(labels.begin(), labels.end()) + 1;
        std::vector<Eigen::Index> counts(static_cast<std::size_t>(k), 0);
        for (const int label: labels) {
            ++counts[static_cast<std::size_t>(label)];
        }
        const auto non_empty = std::count_if(counts.begin(), counts.end(), [](const Eigen::Index c) { return c > 0; });
        if (non_empty < 2) {
            LOG_ERROR("Silhouette requires at least two non-empty clusters, got {}", non_empty);
            throw std::invalid_argument("Silhouette requires at least two non-empty clusters.");
        }

        Eigen::VectorXd result(data.rows());
        std::vector<Eigen::Index> indices(static_cast<std::size_t>(data.rows()));
        std::iota(indices.begin(), indices.end(), 0);

        std::for_each(std::execution::par, indices.begin(), indices.end(), [&](const Eigen::Index i) {
            const auto own = static_cast<std::size_t>(labels[static_cast<std::size_t>(i)]);
            if (counts[own] < 2) {
                result(i) = 0.0;
                return;
            }

            const Eigen::VectorXd distances = (data.rowwise() - data.row(i)).rowwise().norm();
            Eigen::VectorXd sums = Eigen::VectorXd::Zero(k);
            for (Eigen::Index j = 0; j < data.rows(); ++j) {
                sums(labels[static_cast<std::size_t>(j)]) += distances(j);
            }

            // The distance of i to itself is 0, so the own-cluster sum already excludes it.
            const double a = sums(static_cast<Eigen::Index>(own)) / static_cast<double>(counts[own] - 1);
            double b = std::numeric_limits<double>::infinity();
            for (std::size_t c = 0; c < counts.size(); ++c) {
                if (c != own && counts[c] > 0) {
                    b = std::min(b, sums(static_cast<Eigen::Index>(c)) / static_cast<double>(counts[c]));
                }
            }

            const double denominator = std::max(a, b);
            result(i) = denominator > 0.0 ? (b - a) / denominator : 0.0;
        });

        return result;
    }

    double Silhouette::score(const Eigen::MatrixXd &data, const std::vector<int> &labels) {
        return samples(data, labels).mean();
    }

} // namespace clustering
