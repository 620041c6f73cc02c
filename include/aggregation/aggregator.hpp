// File: aggregation/aggregator.hpp

#ifndef AGGREGATOR_HPP
#define AGGREGATOR_HPP

#include <cstddef>
#include <map>
#include <string>
#include <vector>

#include "common/errors.hpp"
#include "common/logging/logger.hpp"
#include "types/player_aggregate.hpp"
#include "types/raw_record.hpp"

namespace aggregation {

    struct EligibilityOptions {
        int min_games = 1;
        double min_minutes = 0.0;
    };

    struct ExcludedPlayer {
        std::string player_id;
        std::string reason;
    };

    struct AggregationResult {
        // Ordered by player identifier so every downstream matrix has a deterministic row order.
        std::map<std::string, PlayerAggregate> players;
        std::size_t records_read = 0;
        std::size_t records_skipped = 0;
    };

    /*
     * Folds raw game records into one aggregate per player. Counting stats are summed;
     * minutes and games accumulate total exposure.
     */
    class Aggregator {
    public:
        // Folds one record into the running table; throws MissingIdentifierError for an unattributable record
        // and std::invalid_argument for negative or non-finite minutes.
        static void accumulate(std::map<std::string, PlayerAggregate> &players, const RawRecord &record,
                               std::size_t record_index);

        // Batch fold. Per-record errors are logged, counted and skipped; they never abort the batch.
        [[nodiscard]] static AggregationResult aggregate(const std::vector<RawRecord> &records);

        // Splits aggregates by the minimum games / minutes thresholds, filling excluded with the reasons.
        [[nodiscard]] static std::vector<PlayerAggregate> filterEligible(const AggregationResult &result,
                                                                         const EligibilityOptions &options,
                                                                         std::vector<ExcludedPlayer> &excluded);
    };

} // namespace aggregation

#endif // AGGREGATOR_HPP
