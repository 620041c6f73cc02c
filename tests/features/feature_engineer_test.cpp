// tests/features/feature_engineer_test.cpp

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "features/feature_engineer.hpp"

using namespace features;
using ::testing::HasSubstr;

class FeatureEngineerTest : public ::testing::Test {
protected:
    FeatureEngineer engineer;

    // Two games, 72 minutes in total: every per-36 rate is half the total.
    static PlayerAggregate makeAggregate() {
        PlayerAggregate aggregate;
        aggregate.player_id = "p1";
        aggregate.player_name = "Player One";
        aggregate.minutes = 72.0;
        aggregate.games = 2;
        aggregate.totals.set(Stat::Points, 30.0)
                .set(Stat::Assists, 6.0)
                .set(Stat::OffensiveRebounds, 2.0)
                .set(Stat::DefensiveRebounds, 8.0)
                .set(Stat::Steals, 2.0)
                .set(Stat::Blocks, 1.0)
                .set(Stat::Turnovers, 3.0)
                .set(Stat::FieldGoalsAttempted, 20.0)
                .set(Stat::FieldGoalsMade, 10.0)
                .set(Stat::ThreePointersAttempted, 6.0)
                .set(Stat::ThreePointersMade, 3.0)
                .set(Stat::FreeThrowsAttempted, 10.0)
                .set(Stat::FreeThrowsMade, 8.0)
                .set(Stat::PersonalFouls, 4.0);
        return aggregate;
    }
};

TEST_F(FeatureEngineerTest, RatesArePerThirtySixMinutes) {
    const auto features = engineer.compute(makeAggregate());
    const auto &f = features.clustering;

    EXPECT_DOUBLE_EQ(f.pts_per36, 15.0);
    EXPECT_DOUBLE_EQ(f.ast_per36, 3.0);
    EXPECT_DOUBLE_EQ(f.orb_per36, 1.0);
    EXPECT_DOUBLE_EQ(f.drb_per36, 4.0);
    EXPECT_DOUBLE_EQ(f.trb_per36, 5.0);
    EXPECT_DOUBLE_EQ(f.stl_per36, 1.0);
    EXPECT_DOUBLE_EQ(f.blk_per36, 0.5);
    EXPECT_DOUBLE_EQ(f.tov_per36, 1.5);
    EXPECT_DOUBLE_EQ(f.fga_per36, 10.0);
    EXPECT_DOUBLE_EQ(f.three_pa_per36, 3.0);
    EXPECT_DOUBLE_EQ(f.two_pa_per36, 7.0);
    EXPECT_DOUBLE_EQ(f.pf_per36, 2.0);
    EXPECT_FALSE(features.low_exposure);
    EXPECT_EQ(features.games, 2);
}

TEST_F(FeatureEngineerTest, SingleGameAggregateOfThirtySixMinutes) {
    PlayerAggregate aggregate = makeAggregate();
    aggregate.minutes = 36.0;
    aggregate.totals.set(Stat::Points, 30.0);

    EXPECT_DOUBLE_EQ(engineer.compute(aggregate).clustering.pts_per36, 30.0);
}

TEST_F(FeatureEngineerTest, ShootingPercentagesAndShares) {
    const auto f = engineer.compute(makeAggregate()).clustering;

    EXPECT_DOUBLE_EQ(f.fg2_pct, 0.5);
    EXPECT_DOUBLE_EQ(f.fg3_pct, 0.5);
    EXPECT_DOUBLE_EQ(f.ft_pct, 0.8);
    EXPECT_DOUBLE_EQ(f.usage_2p, 0.7);
    EXPECT_DOUBLE_EQ(f.usage_3p, 0.3);
    EXPECT_NEAR(f.true_shooting_pct, 30.0 / (2.0 * (20.0 + 0.44 * 10.0)), 1e-12);
}

TEST_F(FeatureEngineerTest, EfficiencyIndicesUseConfiguredWeights) {
    const auto f = engineer.compute(makeAggregate()).clustering;
    EXPECT_NEAR(f.oer, 15.0 + 0.7 * 3.0 + 0.5 * 1.0 - 1.5, 1e-12);
    EXPECT_NEAR(f.der, 1.0 + 0.5 + 0.5 * 4.0 - 0.25 * 2.0, 1e-12);

    FeatureOptions options;
    options.weights = {2.0, 0.0, 0.0, 0.0, 0.0, 0.0, 1.0, 0.0};
    const auto weighted = FeatureEngineer(options).compute(makeAggregate()).clustering;
    EXPECT_DOUBLE_EQ(weighted.oer, 30.0);
    EXPECT_DOUBLE_EQ(weighted.der, 4.0);
}

TEST_F(FeatureEngineerTest, ZeroMinutesLeavesRatesAtZeroAndFlagsThePlayer) {
    PlayerAggregate aggregate = makeAggregate();
    aggregate.minutes = 0.0;

    const auto features = engineer.compute(aggregate);

    EXPECT_TRUE(features.low_exposure);
    EXPECT_DOUBLE_EQ(features.clustering.pts_per36, 0.0);
    EXPECT_DOUBLE_EQ(features.clustering.trb_per36, 0.0);
    EXPECT_DOUBLE_EQ(features.clustering.oer, 0.0);
    // Percentages do not depend on exposure.
    EXPECT_DOUBLE_EQ(features.clustering.ft_pct, 0.8);
}

TEST_F(FeatureEngineerTest, ZeroAttemptsGiveZeroPercentages) {
    PlayerAggregate aggregate = makeAggregate();
    for (const auto stat: {Stat::FieldGoalsAttempted, Stat::FieldGoalsMade, Stat::ThreePointersAttempted,
                           Stat::ThreePointersMade, Stat::FreeThrowsAttempted, Stat::FreeThrowsMade}) {
        aggregate.totals.set(stat, 0.0);
    }

    const auto f = engineer.compute(aggregate).clustering;

    EXPECT_DOUBLE_EQ(f.fg2_pct, 0.0);
    EXPECT_DOUBLE_EQ(f.fg3_pct, 0.0);
    EXPECT_DOUBLE_EQ(f.ft_pct, 0.0);
    EXPECT_DOUBLE_EQ(f.usage_2p, 0.0);
    EXPECT_DOUBLE_EQ(f.usage_3p, 0.0);
    EXPECT_DOUBLE_EQ(f.true_shooting_pct, 0.0);
}

TEST_F(FeatureEngineerTest, InconsistentBoxScoreIsClippedToUnitInterval) {
    PlayerAggregate aggregate = makeAggregate();
    aggregate.totals.set(Stat::FreeThrowsMade, 15.0);
    aggregate.totals.set(Stat::Points, 200.0);

    const auto f = engineer.compute(aggregate).clustering;

    for (const auto column: ClusteringFeatures::kBoundedColumns) {
        EXPECT_GE(f[column], 0.0) << ClusteringFeatures::kNames[column];
        EXPECT_LE(f[column], 1.0) << ClusteringFeatures::kNames[column];
    }
    EXPECT_DOUBLE_EQ(f.ft_pct, 1.0);
    EXPECT_DOUBLE_EQ(f.true_shooting_pct, 1.0);
}

TEST_F(FeatureEngineerTest, MissingRequiredStatThrows) {
    PlayerAggregate aggregate = makeAggregate();
    aggregate.totals.clear(Stat::Steals);

    try {
        (void) engineer.compute(aggregate);
        FAIL() << "Expected InvalidAggregateError";
    } catch (const errors::InvalidAggregateError &e) {
        EXPECT_EQ(e.playerId(), "p1");
        EXPECT_EQ(e.stat(), "stl");
    }
}

TEST_F(FeatureEngineerTest, ComputeAllExcludesInvalidPlayers) {
    PlayerAggregate broken = makeAggregate();
    broken.player_id = "broken";
    broken.totals.clear(Stat::Assists);

    std::vector<aggregation::ExcludedPlayer> excluded;
    const auto features = engineer.computeAll({makeAggregate(), broken}, excluded);

    ASSERT_EQ(features.size(), 1u);
    EXPECT_EQ(features.front().player_id, "p1");
    ASSERT_EQ(excluded.size(), 1u);
    EXPECT_EQ(excluded.front().player_id, "broken");
    EXPECT_THAT(excluded.front().reason, HasSubstr("ast"));
}

TEST_F(FeatureEngineerTest, ShotZonesAreAuxiliaryOnly) {
    PlayerAggregate aggregate = makeAggregate();
    const auto without = engineer.compute(aggregate);
    EXPECT_FALSE(without.has_shot_zones);

    aggregate.totals.set(Stat::InteriorAttempted, 12.0)
            .set(Stat::InteriorMade, 6.0)
            .set(Stat::ExteriorAttempted, 8.0)
            .set(Stat::ExteriorMade, 2.0);
    const auto with = engineer.compute(aggregate);

    EXPECT_TRUE(with.has_shot_zones);
    EXPECT_DOUBLE_EQ(with.auxiliary.interior_pct, 0.5);
    EXPECT_DOUBLE_EQ(with.auxiliary.interior_freq, 0.6);
    EXPECT_DOUBLE_EQ(with.auxiliary.exterior_pct, 0.25);
    EXPECT_DOUBLE_EQ(with.auxiliary.exterior_freq, 0.4);
    EXPECT_EQ(with.clustering.toRow(), without.clustering.toRow());
}

TEST_F(FeatureEngineerTest, RejectsNonPositiveExposureUnit) {
    FeatureOptions options;
    options.exposure_minutes = 0.0;
    EXPECT_THROW(FeatureEngineer{options}, std::invalid_argument);
}

TEST(ClusteringFeaturesTest, ColumnLookupAndRowConversion) {
    EXPECT_EQ(ClusteringFeatures::indexOf("oer").value(), 14u);
    EXPECT_FALSE(ClusteringFeatures::indexOf("plus_minus").has_value());

    ClusteringFeatures features;
    features.oer = 12.5;
    features.pf_per36 = 3.0;
    const auto row = features.toRow();
    EXPECT_EQ(row.size(), 20);
    EXPECT_DOUBLE_EQ(row(14), 12.5);
    EXPECT_DOUBLE_EQ(ClusteringFeatures::fromRow(row).pf_per36, 3.0);
    EXPECT_THROW((void) ClusteringFeatures::fromRow(Eigen::RowVectorXd::Zero(3)), std::invalid_argument);
}
