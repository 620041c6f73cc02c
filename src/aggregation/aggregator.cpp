// File: aggregation/aggregator.cpp

#include "aggregation/aggregator.hpp"

#include <cmath>
#include <fmt/format.h>
#include <stdexcept>

namespace aggregation {

    void Aggregator::accumulate(std::map<std::string, PlayerAggregate> &players, const RawRecord &record,
                                const std::size_t record_index) {
        if (!record.hasIdentifier()) {
            throw errors::MissingIdentifierError(record_index);
        }
        if (!std::isfinite(record.minutes) || record.minutes < 0.0) {
            throw std::invalid_argument(fmt::format("Raw record #{} for player '{}' has invalid minutes {}",
                                                    record_index, *record.player_id, record.minutes));
        }

        const auto &player_id = *record.player_id;
        auto [it, inserted] = players.try_emplace(player_id);
        PlayerAggregate &aggregate = it->second;

        if (inserted) {
            aggregate.player_id = player_id;
            aggregate.totals = record.stats;
        } else {
            aggregate.totals += record.stats;
        }
        if (aggregate.player_name.empty()) {
            aggregate.player_name = record.player_name;
        }
        aggregate.minutes += record.minutes;
        aggregate.games += 1;
    }

    AggregationResult Aggregator::aggregate(const std::vector<RawRecord> &records) {
        AggregationResult result;
        result.records_read = records.size();

        for (std::size_t i = 0; i < records.size(); ++i) {
            try {
                accumulate(result.players, records[i], i);
            } catch (const errors::MissingIdentifierError &e) {
                LOG_WARN("Skipping record: {}", e.what());
                ++result.records_skipped;
            } catch (const std::invalid_argument &e) {
                LOG_WARN("Skipping record: {}", e.what());
                ++result.records_skipped;
            }
        }

        std::size_t zero_exposure = 0;
        for (const auto &[player_id, aggregate]: result.players) {
            if (aggregate.zeroExposure()) {
                LOG_DEBUG("Player '{}' has zero total minutes over {} games", player_id, aggregate.games);
                ++zero_exposure;
            }
        }

        LOG_INFO("Aggregated {} records into {} players ({} skipped, {} with zero minutes)", result.records_read,
                 result.players.size(), result.records_skipped, zero_exposure);
        return result;
    }

    std::vector<PlayerAggregate> Aggregator::filterEligible(const AggregationResult &result,
                                                            const EligibilityOptions &options,
                                                            std::vector<ExcludedPlayer> &excluded) {
        std::vector<PlayerAggregate> eligible;
        eligible.reserve(result.players.size());

        for (const auto &[player_id, aggregate]: result.players) {
            if (aggregate.games < options.min_games) {
                excluded.push_back(
                        {player_id, fmt::format("played {} games, minimum is {}", aggregate.games, options.min_games)});
                continue;
            }
            if (aggregate.minutes < options.min_minutes) {
                excluded.push_back({player_id, fmt::format("played {:.1f} minutes, minimum is {:.1f}",
                                                           aggregate.minutes, options.min_minutes)});
                continue;
            }
            eligible.push_back(aggregate);
        }

        LOG_INFO("Eligibility filter kept {} of {} players (min games {}, min minutes {})", eligible.size(),
                 result.players.size(), options.min_games, options.min_minutes);
        return eligible;
    }

} // namespace aggregation
