// File: reduction/pca.cpp

#include "reduction/pca.hpp"

#include <algorithm>
#include <stdexcept>

namespace reduction {

    PCA::PCA(PcaOptions options) : options_(options) {
        if (options_.components < 1 || options_.variance_curve_components < 1) {
            throw std::invalid_argument("PCA component counts must be positive.");
        }
        if (options_.variance_target <= 0.0 || options_.variance_target > 1.0) {
            throw std::invalid_argument("PCA variance target must lie in (0, 1].");
        }
    }

    void PCA::fixSigns(Eigen::MatrixXd &axes) {
        for (Eigen::Index c = 0; c < axes.cols(); ++c) {
            Eigen::Index largest = 0;
            axes.col(c).cwiseAbs().maxCoeff(&largest);
            if (axes(largest, c) < 0.0) {
                axes.col(c) *= -1.0;
            }
        }
    }

    Projection PCA::fit(const Eigen::MatrixXd &data) const {
        if (data.rows() < 2 || data.cols() < 1) {
            LOG_ERROR("PCA needs at least 2 rows and 1 column, got {}x{}", data.rows(), data.cols());
            throw std::invalid_argument("PCA needs at least two observations.");
        }

        const auto d = data.cols();
        const Eigen::MatrixXd centered = data.rowwise() - data.colwise().mean();
        const Eigen::MatrixXd covariance =
                (centered.adjoint() * centered) / static_cast<double>(data.rows() - 1);

        const Eigen::SelfAdjointEigenSolver<Eigen::MatrixXd> solver(covariance);
        if (solver.info() != Eigen::Success) {
            LOG_ERROR("Eigen-decomposition of the {}x{} covariance matrix failed", d, d);
            throw std::runtime_error("PCA eigen-decomposition failed.");
        }

        // Eigen returns ascending eigenvalues; reverse both into descending order.
        Projection projection;
        projection.eigenvalues = solver.eigenvalues().reverse().cwiseMax(0.0);
        Eigen::MatrixXd axes = solver.eigenvectors().rowwise().reverse();
        fixSigns(axes);

        const auto components = std::min<Eigen::Index>(options_.components, d);
        if (components < options_.components) {
            LOG_WARN("Requested {} principal components but the data has only {} columns", options_.components, d);
        }
        projection.loadings = axes.leftCols(components);
        projection.coordinates = centered * projection.loadings;

        const double total = projection.eigenvalues.sum();
        Eigen::VectorXd ratios = Eigen::VectorXd::Zero(d);
        if (total > 0.0) {
            ratios = projection.eigenvalues / total;
        } else {
            LOG_WARN("Scaled matrix has zero total variance; explained-variance ratios are all 0");
        }

        const auto curve = std::min<Eigen::Index>(options_.variance_curve_components, d);
        projection.explained_variance_ratio = ratios.head(curve);
        projection.cumulative_variance.resize(curve);
        double running = 0.0;
        for (Eigen::Index i = 0; i < curve; ++i) {
            running += ratios(i);
            projection.cumulative_variance(i) = running;
        }

        running = 0.0;
        projection.components_for_target = 0;
        for (Eigen::Index i = 0; i < d && total > 0.0; ++i) {
            running += ratios(i);
            if (running >= options_.variance_target - 1e-12) {
                projection.components_for_target = static_cast<int>(i + 1);
                break;
            }
        }

        LOG_INFO("PCA: first {} components explain {:.1f}% of the variance; {} components reach {:.0f}%",
                 components, 100.0 * ratios.head(components).sum(), projection.components_for_target,
                 100.0 * options_.variance_target);
        LOG_DEBUG("PCA eigenvalues: {:.4f}", projection.eigenvalues);
        return projection;
    }

} // namespace reduction
