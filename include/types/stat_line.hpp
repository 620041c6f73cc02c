// File: types/stat_line.hpp

#ifndef STAT_LINE_HPP
#define STAT_LINE_HPP

#include <array>
#include <bitset>
#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

enum class Stat : std::size_t {
    Points,
    Assists,
    OffensiveRebounds,
    DefensiveRebounds,
    Steals,
    Blocks,
    Turnovers,
    FieldGoalsAttempted,
    FieldGoalsMade,
    ThreePointersAttempted,
    ThreePointersMade,
    FreeThrowsAttempted,
    FreeThrowsMade,
    PersonalFouls,
    // Shot-zone counts, optional
    InteriorAttempted,
    InteriorMade,
    ExteriorAttempted,
    ExteriorMade,
    Count
};

inline constexpr std::size_t kStatCount = static_cast<std::size_t>(Stat::Count);

// Stats up to (and including) PersonalFouls must be present for feature engineering.
inline constexpr std::size_t kRequiredStatCount = static_cast<std::size_t>(Stat::PersonalFouls) + 1;

// Column names used by the CSV reader and in error messages.
inline constexpr std::array<std::string_view, kStatCount> kStatNames = {
        "pts", "ast", "orb", "drb", "stl", "blk", "tov", "fga", "fgm",
        "3pa", "3pm", "fta", "ftm", "pf",  "interior_a", "interior_m", "exterior_a", "exterior_m"};

[[nodiscard]] constexpr std::string_view statName(const Stat stat) noexcept {
    return kStatNames[static_cast<std::size_t>(stat)];
}

/*
 * Fixed-schema set of counting stats. Every slot carries a presence bit so that a stat
 * that was never recorded is distinguishable from a recorded zero.
 */
class StatLine {
public:
    StatLine &set(const Stat stat, const double value) noexcept {
        values_[index(stat)] = value;
        present_.set(index(stat));
        return *this;
    }

    void clear(const Stat stat) noexcept {
        values_[index(stat)] = 0.0;
        present_.reset(index(stat));
    }

    [[nodiscard]] bool has(const Stat stat) const noexcept { return present_.test(index(stat)); }

    // Value of a present stat; throws std::out_of_range for a missing one.
    [[nodiscard]] double get(const Stat stat) const {
        if (!has(stat)) {
            throw std::out_of_range("Stat '" + std::string(statName(stat)) + "' is not present");
        }
        return values_[index(stat)];
    }

    [[nodiscard]] double getOr(const Stat stat, const double fallback) const noexcept {
        return has(stat) ? values_[index(stat)] : fallback;
    }

    [[nodiscard]] std::optional<Stat> firstMissingRequired() const noexcept {
        for (std::size_t i = 0; i < kRequiredStatCount; ++i) {
            if (!present_.test(i)) {
                return static_cast<Stat>(i);
            }
        }
        return std::nullopt;
    }

    // Field-wise sum. A stat stays present only when both sides carry it.
    StatLine &operator+=(const StatLine &other) noexcept {
        for (std::size_t i = 0; i < kStatCount; ++i) {
            values_[i] += other.values_[i];
        }
        present_ &= other.present_;
        return *this;
    }

private:
    std::array<double, kStatCount> values_{};
    std::bitset<kStatCount> present_;

    static constexpr std::size_t index(const Stat stat) noexcept { return static_cast<std::size_t>(stat); }
};

#endif // STAT_LINE_HPP
