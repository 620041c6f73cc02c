// tests/preprocessing/standard_scaler_test.cpp

#include <gtest/gtest.h>
#include <limits>

#include "preprocessing/standard_scaler.hpp"

using namespace preprocessing;

class StandardScalerTest : public ::testing::Test {
protected:
    StandardScaler scaler;
    Eigen::MatrixXd matrix;

    void SetUp() override {
        matrix.resize(4, 3);
        matrix << 1.0, 10.0, 5.0,
                2.0, 20.0, 5.0,
                3.0, 30.0, 5.0,
                4.0, 40.0, 5.0;
    }
};

TEST_F(StandardScalerTest, ColumnsHaveZeroMeanAndUnitPopulationVariance) {
    const auto scaled = scaler.fitTransform(matrix);

    for (Eigen::Index j = 0; j < 2; ++j) {
        const auto column = scaled.values.col(j);
        EXPECT_NEAR(column.mean(), 0.0, 1e-12);
        EXPECT_NEAR(column.array().square().mean(), 1.0, 1e-12);
    }
    EXPECT_DOUBLE_EQ(scaled.parameters.mean()(0), 2.5);
    EXPECT_NEAR(scaled.parameters.scale()(0), std::sqrt(1.25), 1e-12);
}

TEST_F(StandardScalerTest, ZeroVarianceColumnBecomesZero) {
    const auto scaled = scaler.fitTransform(matrix);

    EXPECT_DOUBLE_EQ(scaled.parameters.scale()(2), 1.0);
    EXPECT_TRUE(scaled.values.col(2).isZero());
}

TEST_F(StandardScalerTest, ScalingIsIdempotent) {
    const auto once = scaler.fitTransform(matrix);
    const auto twice = scaler.fitTransform(once.values);

    EXPECT_TRUE(twice.values.isApprox(once.values, 1e-12));
}

TEST_F(StandardScalerTest, InverseTransformRecoversTheInput) {
    const auto scaled = scaler.fitTransform(matrix);
    const auto restored = StandardScaler::inverseTransform(scaled.parameters, scaled.values);

    EXPECT_TRUE(restored.isApprox(matrix, 1e-12));
}

TEST_F(StandardScalerTest, NonFiniteCellsAreFilledBeforeFitting) {
    matrix(1, 0) = std::numeric_limits<double>::quiet_NaN();
    matrix(2, 1) = std::numeric_limits<double>::infinity();

    const auto scaled = scaler.fitTransform(matrix);

    EXPECT_TRUE(scaled.values.allFinite());
    EXPECT_DOUBLE_EQ(scaled.parameters.mean()(0), 2.0);
}

TEST_F(StandardScalerTest, SingleFeatureRowUsesFittedParameters) {
    Eigen::MatrixXd features = Eigen::MatrixXd::Zero(2, static_cast<Eigen::Index>(ClusteringFeatures::kCount));
    features(1, 14) = 10.0;
    const auto parameters = scaler.fit(features);

    ClusteringFeatures player;
    player.oer = 10.0;
    const auto scaled = scaler.transform(parameters, player);

    EXPECT_DOUBLE_EQ(scaled.oer, 1.0);
    EXPECT_DOUBLE_EQ(scaled.pts_per36, 0.0);
}

TEST_F(StandardScalerTest, RejectsMismatchedAndEmptyInput) {
    const auto parameters = scaler.fit(matrix);

    EXPECT_THROW((void) scaler.transform(parameters, Eigen::MatrixXd::Zero(2, 4)), std::invalid_argument);
    EXPECT_THROW((void) scaler.fit(Eigen::MatrixXd(0, 3)), std::invalid_argument);
    EXPECT_THROW(ScalerParameters(Eigen::RowVectorXd::Zero(2), Eigen::RowVectorXd::Ones(3)), std::invalid_argument);
    EXPECT_THROW(ScalerParameters(Eigen::RowVectorXd::Zero(2), Eigen::RowVectorXd::Zero(2)), std::invalid_argument);
}
