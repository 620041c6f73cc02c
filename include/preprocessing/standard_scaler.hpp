// File: preprocessing/standard_scaler.hpp

#ifndef STANDARD_SCALER_HPP
#define STANDARD_SCALER_HPP

#include <Eigen/Dense>
#include <vector>

#include "common/logging/logger.hpp"
#include "types/feature_vector.hpp"

namespace preprocessing {

    // Per-column mean and scale fitted once on the full population. Immutable once built.
    class ScalerParameters {
    public:
        ScalerParameters() = default;

        ScalerParameters(Eigen::RowVectorXd mean, Eigen::RowVectorXd scale);

        [[nodiscard]] const Eigen::RowVectorXd &mean() const noexcept { return mean_; }
        [[nodiscard]] const Eigen::RowVectorXd &scale() const noexcept { return scale_; }
        [[nodiscard]] Eigen::Index columns() const noexcept { return mean_.size(); }

    private:
        Eigen::RowVectorXd mean_;
        Eigen::RowVectorXd scale_;
    };

    struct ScaledMatrix {
        ScalerParameters parameters;
        Eigen::MatrixXd values;
    };

    /*
     * Zero-mean, unit-variance standardization with the population standard deviation.
     * A zero-variance column keeps scale 1 and becomes constant 0. Non-finite cells are
     * replaced by the fill value before fitting or transforming.
     */
    class StandardScaler {
    public:
        explicit StandardScaler(double fill_value = 0.0) noexcept : fill_value_(fill_value) {}

        [[nodiscard]] ScalerParameters fit(const Eigen::MatrixXd &matrix) const;

        [[nodiscard]] Eigen::MatrixXd transform(const ScalerParameters &parameters,
                                                const Eigen::MatrixXd &matrix) const;

        [[nodiscard]] ScaledMatrix fitTransform(const Eigen::MatrixXd &matrix) const;

        // Scores a single player against existing parameters without refitting.
        [[nodiscard]] ClusteringFeatures transform(const ScalerParameters &parameters,
                                                   const ClusteringFeatures &features) const;

        [[nodiscard]] static Eigen::MatrixXd inverseTransform(const ScalerParameters &parameters,
                                                              const Eigen::MatrixXd &scaled);

        // Stacks the clustering features of every player, one row per player in input order.
        [[nodiscard]] static Eigen::MatrixXd toMatrix(const std::vector<FeatureVector> &features);

    private:
        double fill_value_;

        Eigen::MatrixXd sanitize(const Eigen::MatrixXd &matrix) const;

        static void checkColumns(const ScalerParameters &parameters, Eigen::Index columns);
    };

} // namespace preprocessing

#endif // STANDARD_SCALER_HPP
