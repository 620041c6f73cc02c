// File: preprocessing/standard_scaler.cpp

#include "preprocessing/standard_scaler.hpp"

#include <cmath>
#include <stdexcept>
#include <utility>

namespace preprocessing {

    namespace {
        constexpr double kZeroVariance = 1e-12;
    }

    ScalerParameters::ScalerParameters(Eigen::RowVectorXd mean, Eigen::RowVectorXd scale) :
        mean_(std::move(mean)), scale_(std::move(scale)) {
        if (mean_.size() != scale_.size()) {
            LOG_ERROR("Scaler mean and scale differ in size: {} vs {}", mean_.size(), scale_.size());
            throw std::invalid_argument("Scaler mean and scale must have the same number of columns.");
        }
        if ((scale_.array() <= 0.0).any()) {
            throw std::invalid_argument("Scaler scale must be strictly positive.");
        }
    }

    Eigen::MatrixXd StandardScaler::sanitize(const Eigen::MatrixXd &matrix) const {
        Eigen::MatrixXd clean = matrix;
        Eigen::Index replaced = 0;
        for (Eigen::Index j = 0; j < clean.cols(); ++j) {
            for (Eigen::Index i = 0; i < clean.rows(); ++i) {
                if (!std::isfinite(clean(i, j))) {
                    clean(i, j) = fill_value_;
                    ++replaced;
                }
            }
        }
        if (replaced > 0) {
            LOG_WARN("Replaced {} non-finite feature values with {}", replaced, fill_value_);
        }
        return clean;
    }

    void StandardScaler::checkColumns(const ScalerParameters &parameters, const Eigen::Index columns) {
        if (parameters.columns() != columns) {
            LOG_ERROR("Scaler fitted on {} columns, got {}", parameters.columns(), columns);
            throw std::invalid_argument("Matrix column count does not match the fitted scaler.");
        }
    }

    ScalerParameters StandardScaler::fit(const Eigen::MatrixXd &matrix) const {
        if (matrix.rows() == 0 || matrix.cols() == 0) {
            throw std::invalid_argument("Cannot fit a scaler on an empty matrix.");
        }

        const Eigen::MatrixXd clean = sanitize(matrix);
        const Eigen::RowVectorXd mean = clean.colwise().mean();
        const Eigen::MatrixXd centered = clean.rowwise() - mean;
        Eigen::RowVectorXd scale =
                (centered.array().square().colwise().sum() / static_cast<double>(clean.rows())).sqrt().matrix();

        int constant_columns = 0;
        for (Eigen::Index j = 0; j < scale.size(); ++j) {
            if (scale(j) < kZeroVariance) {
                scale(j) = 1.0;
                ++constant_columns;
            }
        }
        if (constant_columns > 0) {
            LOG_DEBUG("{} zero-variance columns keep scale 1", constant_columns);
        }

        LOG_DEBUG("Scaler fitted on {}x{} matrix, mean {:.3f}", clean.rows(), clean.cols(), mean);
        return {mean, scale};
    }

    Eigen::MatrixXd StandardScaler::transform(const ScalerParameters &parameters,
                                              const Eigen::MatrixXd &matrix) const {
        checkColumns(parameters, matrix.cols());
        const Eigen::MatrixXd clean = sanitize(matrix);
        return ((clean.rowwise() - parameters.mean()).array().rowwise() / parameters.scale().array()).matrix();
    }

    ScaledMatrix StandardScaler::fitTransform(const Eigen::MatrixXd &matrix) const {
        auto parameters = fit(matrix);
        auto values = transform(parameters, matrix);
        return {std::move(parameters), std::move(values)};
    }

    ClusteringFeatures StandardScaler::transform(const ScalerParameters &parameters,
                                                 const ClusteringFeatures &features) const {
        const Eigen::MatrixXd row = features.toRow();
        const Eigen::MatrixXd scaled = transform(parameters, row);
        return ClusteringFeatures::fromRow(scaled.row(0));
    }

    Eigen::MatrixXd StandardScaler::inverseTransform(const ScalerParameters &parameters,
                                                     const Eigen::MatrixXd &scaled) {
        checkColumns(parameters, scaled.cols());
        return ((scaled.array().rowwise() * parameters.scale().array()).matrix().rowwise() + parameters.mean());
    }

    Eigen::MatrixXd StandardScaler::toMatrix(const std::vector<FeatureVector> &features) {
        Eigen::MatrixXd matrix(static_cast<Eigen::Index>(features.size()),
                               static_cast<Eigen::Index>(ClusteringFeatures::kCount));
        for (std::size_t i = 0; i < features.size(); ++i) {
            matrix.row(static_cast<Eigen::Index>(i)) = features[i].clustering.toRow();
        }
        return matrix;
    }

} // namespace preprocessing
