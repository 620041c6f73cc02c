// File: features/feature_engineer.cpp

#include "features/feature_engineer.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>

namespace features {

    namespace {
        // Keeps percentage and share features inside [0, 1] when the box score is inconsistent (makes > attempts).
        double clampUnit(const double value, const char *feature, const std::string &player_id) {
            if (value < 0.0 || value > 1.0) {
                LOG_DEBUG("Feature '{}' of player '{}' is {:.4f}, clipped to [0, 1]", feature, player_id, value);
                return std::clamp(value, 0.0, 1.0);
            }
            return value;
        }
    } // namespace

    FeatureEngineer::FeatureEngineer(FeatureOptions options) : options_(options) {
        if (!(options_.exposure_minutes > 0.0)) {
            throw std::invalid_argument("Exposure unit must be a positive number of minutes.");
        }
        if (options_.free_throw_factor < 0.0) {
            throw std::invalid_argument("Free-throw possession factor cannot be negative.");
        }
    }

    double FeatureEngineer::safeRatio(const double numerator, const double denominator) noexcept {
        return denominator > 0.0 ? numerator / denominator : 0.0;
    }

    FeatureVector FeatureEngineer::compute(const PlayerAggregate &aggregate) const {
        if (const auto missing = aggregate.totals.firstMissingRequired()) {
            throw errors::InvalidAggregateError(aggregate.player_id, std::string(statName(*missing)));
        }

        FeatureVector features;
        features.player_id = aggregate.player_id;
        features.player_name = aggregate.player_name;
        features.minutes = aggregate.minutes;
        features.games = aggregate.games;

        computeRates(aggregate, features);
        computeShooting(aggregate, features);
        computeEfficiency(features);
        computeShotZones(aggregate, features);

        return features;
    }

    void FeatureEngineer::computeRates(const PlayerAggregate &aggregate, FeatureVector &features) const {
        if (aggregate.zeroExposure()) {
            // Every rate stays at its 0 default.
            features.low_exposure = true;
            return;
        }

        const auto &totals = aggregate.totals;
        const double factor = options_.exposure_minutes / aggregate.minutes;
        const auto rate = [&totals, factor](const Stat stat) { return totals.get(stat) * factor; };

        auto &f = features.clustering;
        f.pts_per36 = rate(Stat::Points);
        f.ast_per36 = rate(Stat::Assists);
        f.orb_per36 = rate(Stat::OffensiveRebounds);
        f.drb_per36 = rate(Stat::DefensiveRebounds);
        f.trb_per36 = (totals.get(Stat::OffensiveRebounds) + totals.get(Stat::DefensiveRebounds)) * factor;
        f.stl_per36 = rate(Stat::Steals);
        f.blk_per36 = rate(Stat::Blocks);
        f.tov_per36 = rate(Stat::Turnovers);
        f.fga_per36 = rate(Stat::FieldGoalsAttempted);
        f.three_pa_per36 = rate(Stat::ThreePointersAttempted);
        f.two_pa_per36 =
                std::max(0.0, totals.get(Stat::FieldGoalsAttempted) - totals.get(Stat::ThreePointersAttempted)) *
                factor;
        f.pf_per36 = rate(Stat::PersonalFouls);
    }

    void FeatureEngineer::computeShooting(const PlayerAggregate &aggregate, FeatureVector &features) const {
        const auto &totals = aggregate.totals;
        const auto &id = aggregate.player_id;

        const double fga = totals.get(Stat::FieldGoalsAttempted);
        const double fgm = totals.get(Stat::FieldGoalsMade);
        const double three_pa = totals.get(Stat::ThreePointersAttempted);
        const double three_pm = totals.get(Stat::ThreePointersMade);
        const double fta = totals.get(Stat::FreeThrowsAttempted);
        const double ftm = totals.get(Stat::FreeThrowsMade);
        const double two_pa = std::max(0.0, fga - three_pa);
        const double two_pm = std::max(0.0, fgm - three_pm);

        auto &f = features.clustering;
        f.fg2_pct = clampUnit(safeRatio(two_pm, two_pa), "fg2_pct", id);
        f.fg3_pct = clampUnit(safeRatio(three_pm, three_pa), "fg3_pct", id);
        f.ft_pct = clampUnit(safeRatio(ftm, fta), "ft_pct", id);

        f.usage_2p = clampUnit(safeRatio(two_pa, fga), "usage_2p", id);
        f.usage_3p = clampUnit(safeRatio(three_pa, fga), "usage_3p", id);

        const double true_shooting_attempts = 2.0 * (fga + options_.free_throw_factor * fta);
        f.true_shooting_pct =
                clampUnit(safeRatio(totals.get(Stat::Points), true_shooting_attempts), "true_shooting_pct", id);
    }

    void FeatureEngineer::computeEfficiency(FeatureVector &features) const {
        const auto &w = options_.weights;
        auto &f = features.clustering;

        f.oer = w.points * f.pts_per36 + w.assists * f.ast_per36 + w.offensive_rebounds * f.orb_per36 +
                w.turnovers * f.tov_per36;
        f.der = w.steals * f.stl_per36 + w.blocks * f.blk_per36 + w.defensive_rebounds * f.drb_per36 +
                w.personal_fouls * f.pf_per36;
    }

    void FeatureEngineer::computeShotZones(const PlayerAggregate &aggregate, FeatureVector &features) {
        const auto &totals = aggregate.totals;
        const bool has_zones = totals.has(Stat::InteriorAttempted) && totals.has(Stat::InteriorMade) &&
                               totals.has(Stat::ExteriorAttempted) && totals.has(Stat::ExteriorMade);
        features.has_shot_zones = has_zones;
        if (!has_zones) {
            return;
        }

        const auto &id = aggregate.player_id;
        const double fga = totals.get(Stat::FieldGoalsAttempted);
        const double interior_attempted = totals.get(Stat::InteriorAttempted);
        const double exterior_attempted = totals.get(Stat::ExteriorAttempted);

        auto &a = features.auxiliary;
        a.interior_pct = clampUnit(safeRatio(totals.get(Stat::InteriorMade), interior_attempted), "interior_pct", id);
        a.interior_freq = clampUnit(safeRatio(interior_attempted, fga), "interior_freq", id);
        a.exterior_pct = clampUnit(safeRatio(totals.get(Stat::ExteriorMade), exterior_attempted), "exterior_pct", id);
        a.exterior_freq = clampUnit(safeRatio(exterior_attempted, fga), "exterior_freq", id);
    }

    std::vector<FeatureVector> FeatureEngineer::computeAll(const std::vector<PlayerAggregate> &aggregates,
                                                           std::vector<aggregation::ExcludedPlayer> &excluded) const {
        std::vector<FeatureVector> result;
        result.reserve(aggregates.size());

        std::size_t low_exposure = 0;
        for (const auto &aggregate: aggregates) {
            try {
                result.push_back(compute(aggregate));
                if (result.back().low_exposure) {
                    ++low_exposure;
                }
            } catch (const errors::InvalidAggregateError &e) {
                LOG_WARN("Excluding player from the feature matrix: {}", e.what());
                excluded.push_back({e.playerId(), e.what()});
            }
        }

        LOG_INFO("Engineered features for {} of {} players ({} low-exposure, exposure unit {} minutes)",
                 result.size(), aggregates.size(), low_exposure, options_.exposure_minutes);
        return result;
    }

} // namespace features
