// File: clustering/silhouette.hpp

#ifndef SILHOUETTE_HPP
#define SILHOUETTE_HPP

#include <Eigen/Dense>
#include <vector>

namespace clustering {

    /*
     * Silhouette validity metric with Euclidean distance.
     *   a(i): mean distance from i to the other members of its cluster
     *   b(i): smallest mean distance from i to the members of another cluster
     *   s(i) = (b - a) / max(a, b), and 0 for a point alone in its cluster.
     * The score is the mean of s(i) over all points; points are evaluated in parallel.
     */
    class Silhouette {
    public:
        // Throws std::invalid_argument unless the labels cover at least two non-empty clusters.
        [[nodiscard]] static Eigen::VectorXd samples(const Eigen::MatrixXd &data, const std::vector<int> &labels);

        [[nodiscard]] static double score(const Eigen::MatrixXd &data, const std::vector<int> &labels);
    };

} // namespace clustering

#endif // SILHOUETTE_HPP
