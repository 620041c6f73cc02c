// tests/config/configuration_test.cpp

#include <gtest/gtest.h>

#include "config/pipeline_config.hpp"

using namespace config;

class ConfigurationTest : public ::testing::Test {
protected:
    static YAML::Node document() {
        return YAML::Load(R"(
aggregation:
  min_games: 3
  min_minutes: 60.5
features:
  exposure_minutes: 40.0
  efficiency:
    offensive:
      turnovers: -2.0
clustering:
  k_min: 3
  k_max: 8
  seed: 7
  restarts: 4
  canonical_feature: der
stability:
  seeds: [5, 9, 13]
  threshold: 0.8
  keep_run_labels: true
output:
  directory: results
)");
    }
};

TEST_F(ConfigurationTest, FlattensNestedKeys) {
    const Configuration configuration(document());

    EXPECT_TRUE(configuration.contains("clustering.k_min"));
    EXPECT_TRUE(configuration.contains("features.efficiency.offensive.turnovers"));
    EXPECT_FALSE(configuration.contains("clustering"));
    EXPECT_EQ(configuration.get<int>("clustering.k_max").value(), 8);
    EXPECT_DOUBLE_EQ(configuration.get<double>("aggregation.min_minutes").value(), 60.5);
}

TEST_F(ConfigurationTest, MissingOrMistypedKeysFallBack) {
    const Configuration configuration(document());

    EXPECT_FALSE(configuration.get<int>("clustering.unknown").has_value());
    EXPECT_FALSE(configuration.get<int>("clustering.canonical_feature").has_value());
    EXPECT_EQ(configuration.get("clustering.unknown", 11), 11);
    EXPECT_EQ(configuration.get("logging.level", "info"), "info");
}

TEST_F(ConfigurationTest, SetNotifiesCallbacks) {
    Configuration configuration(document());
    std::string changed_key;
    configuration.registerChangeCallback([&changed_key](const std::string &key, const YAML::Node &) {
        changed_key = key;
    });

    EXPECT_TRUE(configuration.set("clustering.k_max", 6));

    EXPECT_EQ(changed_key, "clustering.k_max");
    EXPECT_EQ(configuration.get<int>("clustering.k_max").value(), 6);
}

TEST_F(ConfigurationTest, PipelineConfigMapsEveryStage) {
    const Configuration configuration(document());
    const auto pipeline = PipelineConfig::fromConfiguration(configuration);

    EXPECT_EQ(pipeline.eligibility.min_games, 3);
    EXPECT_DOUBLE_EQ(pipeline.eligibility.min_minutes, 60.5);
    EXPECT_DOUBLE_EQ(pipeline.features.exposure_minutes, 40.0);
    EXPECT_DOUBLE_EQ(pipeline.features.weights.turnovers, -2.0);
    EXPECT_DOUBLE_EQ(pipeline.features.weights.points, 1.0);
    EXPECT_EQ(pipeline.selection.k_min, 3);
    EXPECT_EQ(pipeline.selection.k_max, 8);
    EXPECT_EQ(pipeline.selection.seed, 7u);
    EXPECT_EQ(pipeline.selection.kmeans.restarts, 4);
    EXPECT_EQ(pipeline.clusterer.seed, 7u);
    EXPECT_EQ(pipeline.clusterer.kmeans.restarts, 4);
    EXPECT_EQ(pipeline.clusterer.canonical_feature, "der");
    EXPECT_EQ(pipeline.stability.seeds, (std::vector<std::uint64_t>{5, 9, 13}));
    EXPECT_DOUBLE_EQ(pipeline.stability.threshold, 0.8);
    EXPECT_TRUE(pipeline.stability.keep_run_labels);
    EXPECT_EQ(pipeline.output_directory, "results");
}

TEST_F(ConfigurationTest, AbsentSectionsKeepDefaults) {
    const Configuration configuration(YAML::Load("{}"));
    const auto pipeline = PipelineConfig::fromConfiguration(configuration);

    EXPECT_EQ(pipeline.eligibility.min_games, 5);
    EXPECT_EQ(pipeline.selection.k_min, 2);
    EXPECT_EQ(pipeline.selection.k_max, 12);
    EXPECT_EQ(pipeline.selection.seed, 42u);
    EXPECT_EQ(pipeline.stability.repetitions, 50);
    EXPECT_EQ(pipeline.stability.base_seed, 1000u);
    EXPECT_TRUE(pipeline.stability.seeds.empty());
    EXPECT_EQ(pipeline.reduction.components, 2);
    EXPECT_EQ(pipeline.clusterer.canonical_feature, "oer");
    EXPECT_EQ(pipeline.input_records, "data/records.csv");
}
