// File: types/raw_record.hpp

#ifndef RAW_RECORD_HPP
#define RAW_RECORD_HPP

#include <optional>
#include <string>

#include "types/stat_line.hpp"

// One observed stat-line of one player in one game.
struct RawRecord {
    std::optional<std::string> player_id;
    std::string player_name;
    std::string game_id;
    double minutes = 0.0;
    StatLine stats;

    [[nodiscard]] bool hasIdentifier() const noexcept { return player_id.has_value() && !player_id->empty(); }
};

#endif // RAW_RECORD_HPP
