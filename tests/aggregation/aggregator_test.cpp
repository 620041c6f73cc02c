// tests/aggregation/aggregator_test.cpp

#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <limits>

#include "aggregation/aggregator.hpp"

using namespace aggregation;
using ::testing::HasSubstr;

class AggregatorTest : public ::testing::Test {
protected:
    static RawRecord makeRecord(const std::string &player_id, const double minutes, const double points) {
        RawRecord record;
        record.player_id = player_id;
        record.player_name = "Name of " + player_id;
        record.minutes = minutes;
        for (std::size_t i = 0; i < kRequiredStatCount; ++i) {
            record.stats.set(static_cast<Stat>(i), 1.0);
        }
        record.stats.set(Stat::Points, points);
        return record;
    }
};

TEST_F(AggregatorTest, SumsStatsAndExposurePerPlayer) {
    const std::vector<RawRecord> records = {makeRecord("p1", 20.0, 10.0), makeRecord("p1", 16.0, 20.0)};

    const auto result = Aggregator::aggregate(records);

    ASSERT_EQ(result.players.size(), 1u);
    const auto &aggregate = result.players.at("p1");
    EXPECT_DOUBLE_EQ(aggregate.totals.get(Stat::Points), 30.0);
    EXPECT_DOUBLE_EQ(aggregate.totals.get(Stat::Assists), 2.0);
    EXPECT_DOUBLE_EQ(aggregate.minutes, 36.0);
    EXPECT_EQ(aggregate.games, 2);
    EXPECT_EQ(aggregate.player_name, "Name of p1");
    EXPECT_EQ(result.records_read, 2u);
    EXPECT_EQ(result.records_skipped, 0u);
}

TEST_F(AggregatorTest, SkipsRecordsWithoutIdentifier) {
    auto anonymous = makeRecord("", 30.0, 12.0);
    auto unset = makeRecord("x", 30.0, 12.0);
    unset.player_id.reset();
    const std::vector<RawRecord> records = {makeRecord("p1", 30.0, 10.0), anonymous, unset};

    const auto result = Aggregator::aggregate(records);

    EXPECT_EQ(result.players.size(), 1u);
    EXPECT_EQ(result.records_read, 3u);
    EXPECT_EQ(result.records_skipped, 2u);
}

TEST_F(AggregatorTest, AccumulateReportsTheRecordIndex) {
    std::map<std::string, PlayerAggregate> players;
    auto record = makeRecord("p1", 10.0, 5.0);
    record.player_id.reset();

    try {
        Aggregator::accumulate(players, record, 7);
        FAIL() << "Expected MissingIdentifierError";
    } catch (const errors::MissingIdentifierError &e) {
        EXPECT_EQ(e.recordIndex(), 7u);
    }
    EXPECT_TRUE(players.empty());
}

TEST_F(AggregatorTest, SkipsRecordsWithInvalidMinutes) {
    const std::vector<RawRecord> records = {makeRecord("p1", -5.0, 10.0),
                                            makeRecord("p2", std::numeric_limits<double>::quiet_NaN(), 10.0),
                                            makeRecord("p3", 12.0, 10.0)};

    const auto result = Aggregator::aggregate(records);

    EXPECT_EQ(result.players.size(), 1u);
    EXPECT_TRUE(result.players.count("p3"));
    EXPECT_EQ(result.records_skipped, 2u);
}

TEST_F(AggregatorTest, ZeroMinutePlayersAreKept) {
    const auto result = Aggregator::aggregate({makeRecord("bench", 0.0, 0.0), makeRecord("bench", 0.0, 0.0)});

    ASSERT_EQ(result.players.size(), 1u);
    EXPECT_TRUE(result.players.at("bench").zeroExposure());
    EXPECT_EQ(result.players.at("bench").games, 2);
}

TEST_F(AggregatorTest, PlayersAreOrderedByIdentifier) {
    const auto result = Aggregator::aggregate(
            {makeRecord("zeta", 10.0, 1.0), makeRecord("alpha", 10.0, 1.0), makeRecord("mid", 10.0, 1.0)});

    std::vector<std::string> ids;
    for (const auto &[id, aggregate]: result.players) {
        ids.push_back(id);
    }
    EXPECT_EQ(ids, (std::vector<std::string>{"alpha", "mid", "zeta"}));
}

TEST_F(AggregatorTest, FilterEligibleAppliesGameAndMinuteThresholds) {
    std::vector<RawRecord> records;
    for (int g = 0; g < 5; ++g) {
        records.push_back(makeRecord("regular", 30.0, 10.0));
    }
    for (int g = 0; g < 2; ++g) {
        records.push_back(makeRecord("rookie", 30.0, 10.0));
    }
    for (int g = 0; g < 5; ++g) {
        records.push_back(makeRecord("bench", 2.0, 0.0));
    }
    const auto result = Aggregator::aggregate(records);

    std::vector<ExcludedPlayer> excluded;
    const auto eligible = Aggregator::filterEligible(result, {5, 50.0}, excluded);

    ASSERT_EQ(eligible.size(), 1u);
    EXPECT_EQ(eligible.front().player_id, "regular");
    ASSERT_EQ(excluded.size(), 2u);
    EXPECT_EQ(excluded[0].player_id, "bench");
    EXPECT_THAT(excluded[0].reason, HasSubstr("minutes"));
    EXPECT_EQ(excluded[1].player_id, "rookie");
    EXPECT_THAT(excluded[1].reason, HasSubstr("games"));
}
