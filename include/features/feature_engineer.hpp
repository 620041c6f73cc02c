// File: features/feature_engineer.hpp

#ifndef FEATURE_ENGINEER_HPP
#define FEATURE_ENGINEER_HPP

#include <vector>

#include "aggregation/aggregator.hpp"
#include "common/errors.hpp"
#include "common/logging/logger.hpp"
#include "types/feature_vector.hpp"
#include "types/player_aggregate.hpp"

namespace features {

    /*
     * Signed weights of the composite efficiency indices, applied to per-exposure rates:
     *   oer = points * pts + assists * ast + offensive_rebounds * orb + turnovers * tov
     *   der = steals * stl + blocks * blk + defensive_rebounds * drb + personal_fouls * pf
     * Turnovers and fouls carry negative weights; the values are used exactly as configured.
     */
    struct EfficiencyWeights {
        double points = 1.0;
        double assists = 0.7;
        double offensive_rebounds = 0.5;
        double turnovers = -1.0;

        double steals = 1.0;
        double blocks = 1.0;
        double defensive_rebounds = 0.5;
        double personal_fouls = -0.25;
    };

    struct FeatureOptions {
        double exposure_minutes = 36.0;
        // Share of free-throw attempts that end a possession (true shooting denominator).
        double free_throw_factor = 0.44;
        EfficiencyWeights weights;
    };

    class FeatureEngineer {
    public:
        explicit FeatureEngineer(FeatureOptions options = {});

        // Pure per-player derivation. Throws InvalidAggregateError when a required stat is missing.
        [[nodiscard]] FeatureVector compute(const PlayerAggregate &aggregate) const;

        // Per-player errors exclude the player with a warning; excluded receives the reasons.
        [[nodiscard]] std::vector<FeatureVector> computeAll(const std::vector<PlayerAggregate> &aggregates,
                                                            std::vector<aggregation::ExcludedPlayer> &excluded) const;

        // numerator / denominator, defined as 0 for a non-positive denominator.
        [[nodiscard]] static double safeRatio(double numerator, double denominator) noexcept;

    private:
        FeatureOptions options_;

        void computeRates(const PlayerAggregate &aggregate, FeatureVector &features) const;

        void computeShooting(const PlayerAggregate &aggregate, FeatureVector &features) const;

        void computeEfficiency(FeatureVector &features) const;

        static void computeShotZones(const PlayerAggregate &aggregate, FeatureVector &features);
    };

} // namespace features

#endif // FEATURE_ENGINEER_HPP
