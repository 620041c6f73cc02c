// File: reduction/pca.hpp

#ifndef PCA_HPP
#define PCA_HPP

#include <Eigen/Dense>

#include "common/logging/logger.hpp"

namespace reduction {

    struct PcaOptions {
        int components = 2;
        int variance_curve_components = 10;
        double variance_target = 0.9;
    };

    struct Projection {
        Eigen::MatrixXd coordinates;             // n x components, same row order as the input.
        Eigen::MatrixXd loadings;                // d x components, one principal axis per column.
        Eigen::VectorXd eigenvalues;             // All d eigenvalues, descending.
        Eigen::VectorXd explained_variance_ratio; // First variance_curve_components ratios.
        Eigen::VectorXd cumulative_variance;     // Running sum of explained_variance_ratio.
        int components_for_target = 0;           // Smallest count whose cumulative ratio reaches the target.
    };

    /*
     * Principal-component analysis of an already scaled matrix: sample covariance (n - 1),
     * symmetric eigen-decomposition, axes ordered by descending eigenvalue with the sign chosen so
     * that the largest-magnitude loading of each axis is positive. Deterministic.
     */
    class PCA {
    public:
        explicit PCA(PcaOptions options = {});

        [[nodiscard]] Projection fit(const Eigen::MatrixXd &data) const;

    private:
        PcaOptions options_;

        static void fixSigns(Eigen::MatrixXd &axes);
    };

} // namespace reduction

#endif // PCA_HPP
