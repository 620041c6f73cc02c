// tests/reduction/pca_test.cpp

#include <gtest/gtest.h>
#include <cmath>

#include "reduction/pca.hpp"
#include "support/synthetic_data.hpp"

using namespace reduction;

TEST(PCATest, CollinearDataHasASingleComponent) {
    Eigen::MatrixXd data(5, 2);
    data << -2.0, -4.0,
            -1.0, -2.0,
            0.0, 0.0,
            1.0, 2.0,
            2.0, 4.0;

    const auto projection = PCA().fit(data);

    EXPECT_NEAR(projection.eigenvalues(0), 12.5, 1e-9);
    EXPECT_NEAR(projection.eigenvalues(1), 0.0, 1e-9);
    EXPECT_NEAR(projection.explained_variance_ratio(0), 1.0, 1e-9);
    EXPECT_EQ(projection.components_for_target, 1);

    const double norm = std::sqrt(5.0);
    EXPECT_NEAR(projection.loadings(0, 0), 1.0 / norm, 1e-9);
    EXPECT_NEAR(projection.loadings(1, 0), 2.0 / norm, 1e-9);
    EXPECT_NEAR(projection.coordinates(0, 0), -10.0 / norm, 1e-9);
    EXPECT_NEAR(projection.coordinates(4, 0), 10.0 / norm, 1e-9);
}

TEST(PCATest, AxisAlignedVarianceCurve) {
    Eigen::MatrixXd data(4, 2);
    data << 2.0, 0.0,
            -2.0, 0.0,
            0.0, 1.0,
            0.0, -1.0;

    const auto projection = PCA().fit(data);

    EXPECT_NEAR(projection.eigenvalues(0), 8.0 / 3.0, 1e-12);
    EXPECT_NEAR(projection.eigenvalues(1), 2.0 / 3.0, 1e-12);
    EXPECT_NEAR(projection.explained_variance_ratio(0), 0.8, 1e-12);
    EXPECT_NEAR(projection.cumulative_variance(1), 1.0, 1e-12);
    EXPECT_EQ(projection.components_for_target, 2);
    EXPECT_NEAR(projection.loadings(0, 0), 1.0, 1e-12);
    EXPECT_NEAR(projection.loadings(1, 1), 1.0, 1e-12);
}

TEST(PCATest, ShapesAndOrdering) {
    const auto data = test_support::gaussianBlobs(4, 20, 12, 1.0, 5.0, 17);
    const auto projection = PCA().fit(data);

    EXPECT_EQ(projection.coordinates.rows(), 80);
    EXPECT_EQ(projection.coordinates.cols(), 2);
    EXPECT_EQ(projection.loadings.rows(), 12);
    EXPECT_EQ(projection.eigenvalues.size(), 12);
    EXPECT_EQ(projection.explained_variance_ratio.size(), 10);
    for (Eigen::Index i = 1; i < projection.eigenvalues.size(); ++i) {
        EXPECT_GE(projection.eigenvalues(i - 1), projection.eigenvalues(i));
    }
    for (Eigen::Index c = 0; c < projection.loadings.cols(); ++c) {
        Eigen::Index largest = 0;
        projection.loadings.col(c).cwiseAbs().maxCoeff(&largest);
        EXPECT_GT(projection.loadings(largest, c), 0.0);
        EXPECT_NEAR(projection.loadings.col(c).norm(), 1.0, 1e-9);
    }
    EXPECT_GE(projection.components_for_target, 1);
    EXPECT_LE(projection.components_for_target, 12);
}

TEST(PCATest, ProjectionIsDeterministic) {
    const auto data = test_support::gaussianBlobs(3, 15, 6, 1.0, 5.0, 23);
    EXPECT_EQ(PCA().fit(data).coordinates, PCA().fit(data).coordinates);
}

TEST(PCATest, ZeroVarianceGivesZeroRatios) {
    const auto projection = PCA().fit(Eigen::MatrixXd::Ones(5, 3));

    EXPECT_TRUE(projection.explained_variance_ratio.isZero());
    EXPECT_EQ(projection.components_for_target, 0);
}

TEST(PCATest, RejectsInvalidInput) {
    EXPECT_THROW((void) PCA().fit(Eigen::MatrixXd::Ones(1, 3)), std::invalid_argument);
    EXPECT_THROW(PCA({0, 10, 0.9}), std::invalid_argument);
    EXPECT_THROW(PCA({2, 10, 1.5}), std::invalid_argument);
}
