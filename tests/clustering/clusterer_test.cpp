// tests/clustering/clusterer_test.cpp

#include <gtest/gtest.h>
#include <numeric>

#include "clustering/clusterer.hpp"
#include "support/synthetic_data.hpp"

using namespace clustering;

class ClustererTest : public ::testing::Test {
protected:
    Eigen::MatrixXd data;
    std::vector<int> truth;
    std::vector<std::string> ids;

    void SetUp() override {
        data = test_support::gaussianBlobs(4, 25, static_cast<int>(ClusteringFeatures::kCount), 1.0, 10.0, 99, &truth);
        for (Eigen::Index i = 0; i < data.rows(); ++i) {
            ids.push_back("player-" + std::to_string(i));
        }
    }
};

TEST_F(ClustererTest, LabelsFollowAscendingCanonicalFeature) {
    const Clusterer clusterer;
    const auto result = clusterer.fit(data, ids, 4);
    const auto column = clusterer.canonicalColumn();

    EXPECT_EQ(column, 14);
    for (Eigen::Index c = 1; c < result.model.centroids.rows(); ++c) {
        EXPECT_LT(result.model.centroids(c - 1, column), result.model.centroids(c, column));
    }
    EXPECT_EQ(result.model.canonical_feature, "oer");
}

TEST_F(ClustererTest, CanonicalLabelsDoNotDependOnTheSeed) {
    ClustererOptions other;
    other.seed = 7;

    const auto first = Clusterer().fit(data, ids, 4);
    const auto second = Clusterer(other).fit(data, ids, 4);

    ASSERT_EQ(first.assignments.size(), second.assignments.size());
    for (std::size_t i = 0; i < first.assignments.size(); ++i) {
        EXPECT_EQ(first.assignments[i].label, second.assignments[i].label);
    }
}

TEST_F(ClustererTest, ModelDescribesTheFit) {
    const auto result = Clusterer().fit(data, ids, 4);
    const auto &model = result.model;

    EXPECT_EQ(model.k, 4);
    EXPECT_EQ(model.centroids.rows(), 4);
    EXPECT_EQ(model.centroids.cols(), static_cast<Eigen::Index>(ClusteringFeatures::kCount));
    EXPECT_EQ(std::accumulate(model.cluster_sizes.begin(), model.cluster_sizes.end(), 0), data.rows());
    EXPECT_GT(model.silhouette, 0.5);
    EXPECT_TRUE(model.converged);
    EXPECT_EQ(model.seed, 42u);

    std::vector<int> labels;
    for (std::size_t i = 0; i < result.assignments.size(); ++i) {
        EXPECT_EQ(result.assignments[i].player_id, ids[i]);
        labels.push_back(result.assignments[i].label);
    }
    EXPECT_DOUBLE_EQ(test_support::matchedFraction(truth, labels), 1.0);
}

TEST_F(ClustererTest, PredictAgreesWithAssignments) {
    const auto result = Clusterer().fit(data, ids, 4);

    for (Eigen::Index i = 0; i < data.rows(); ++i) {
        const auto prediction = result.model.predict(data.row(i));
        const auto &assignment = result.assignments[static_cast<std::size_t>(i)];
        EXPECT_EQ(prediction.label, assignment.label);
        EXPECT_NEAR(prediction.distance, assignment.distance, 1e-9);
    }

    const auto centroid = ClusteringFeatures::fromRow(result.model.centroids.row(2));
    EXPECT_EQ(result.model.predict(centroid).label, 2);
    EXPECT_THROW((void) result.model.predict(Eigen::RowVectorXd::Zero(3)), std::invalid_argument);
    EXPECT_THROW((void) ClusterModel{}.predict(Eigen::RowVectorXd::Zero(3)), std::logic_error);
}

TEST_F(ClustererTest, RejectsInvalidConfigurationAndInput) {
    ClustererOptions options;
    options.canonical_feature = "plus_minus";
    EXPECT_THROW(Clusterer{options}, std::invalid_argument);

    const Clusterer clusterer;
    ids.pop_back();
    EXPECT_THROW((void) clusterer.fit(data, ids, 4), std::invalid_argument);
    EXPECT_THROW((void) clusterer.fitCanonical(Eigen::MatrixXd::Random(10, 5), 2, 1), std::invalid_argument);
}
