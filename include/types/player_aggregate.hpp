// File: types/player_aggregate.hpp

#ifndef PLAYER_AGGREGATE_HPP
#define PLAYER_AGGREGATE_HPP

#include <string>

#include "types/stat_line.hpp"

struct PlayerAggregate {
    std::string player_id;
    std::string player_name;
    StatLine totals;
    double minutes = 0.0;
    int games = 0;

    // No rate feature can be derived for a player without playing time.
    [[nodiscard]] bool zeroExposure() const noexcept { return minutes <= 0.0; }
};

#endif // PLAYER_AGGREGATE_HPP
