// File: types/feature_vector.hpp

#ifndef FEATURE_VECTOR_HPP
#define FEATURE_VECTOR_HPP

#include <Eigen/Core>
#include <array>
#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

/*
 * The 20 clustering dimensions. Rates are per exposure unit (36 minutes by default),
 * percentages and shares lie in [0, 1], oer/der are the composite efficiency indices.
 * Column order of every feature matrix in the pipeline follows kMembers.
 */
struct ClusteringFeatures {
    double pts_per36 = 0.0;
    double ast_per36 = 0.0;
    double trb_per36 = 0.0;
    double stl_per36 = 0.0;
    double blk_per36 = 0.0;
    double tov_per36 = 0.0;
    double fga_per36 = 0.0;
    double three_pa_per36 = 0.0;
    double two_pa_per36 = 0.0;
    double fg2_pct = 0.0;
    double fg3_pct = 0.0;
    double ft_pct = 0.0;
    double usage_2p = 0.0;
    double usage_3p = 0.0;
    double oer = 0.0;
    double der = 0.0;
    double true_shooting_pct = 0.0;
    double orb_per36 = 0.0;
    double drb_per36 = 0.0;
    double pf_per36 = 0.0;

    static constexpr std::size_t kCount = 20;

    static const std::array<double ClusteringFeatures::*, kCount> kMembers;

    static constexpr std::array<std::string_view, kCount> kNames = {
            "pts_per36", "ast_per36", "trb_per36", "stl_per36",  "blk_per36", "tov_per36",         "fga_per36",
            "3pa_per36", "2pa_per36", "fg2_pct",   "fg3_pct",    "ft_pct",    "usage_2p",          "usage_3p",
            "oer",       "der",       "true_shooting_pct",       "orb_per36", "drb_per36",         "pf_per36"};

    // Percentage and share columns, bounded to [0, 1].
    static constexpr std::array<std::size_t, 6> kBoundedColumns = {9, 10, 11, 12, 13, 16};

    [[nodiscard]] static std::optional<std::size_t> indexOf(const std::string_view name) noexcept {
        for (std::size_t i = 0; i < kCount; ++i) {
            if (kNames[i] == name) {
                return i;
            }
        }
        return std::nullopt;
    }

    [[nodiscard]] double operator[](const std::size_t column) const { return this->*kMembers.at(column); }
    double &operator[](const std::size_t column) { return this->*kMembers.at(column); }

    [[nodiscard]] Eigen::RowVectorXd toRow() const {
        Eigen::RowVectorXd row(static_cast<Eigen::Index>(kCount));
        for (std::size_t i = 0; i < kCount; ++i) {
            row(static_cast<Eigen::Index>(i)) = this->*kMembers[i];
        }
        return row;
    }

    [[nodiscard]] static ClusteringFeatures fromRow(const Eigen::Ref<const Eigen::RowVectorXd> &row) {
        if (row.size() != static_cast<Eigen::Index>(kCount)) {
            throw std::invalid_argument("Clustering feature row must have " + std::to_string(kCount) +
                                        " columns, got " + std::to_string(row.size()));
        }
        ClusteringFeatures features;
        for (std::size_t i = 0; i < kCount; ++i) {
            features.*kMembers[i] = row(static_cast<Eigen::Index>(i));
        }
        return features;
    }
};

inline const std::array<double ClusteringFeatures::*, ClusteringFeatures::kCount> ClusteringFeatures::kMembers = {
            &ClusteringFeatures::pts_per36,      &ClusteringFeatures::ast_per36,
            &ClusteringFeatures::trb_per36,      &ClusteringFeatures::stl_per36,
            &ClusteringFeatures::blk_per36,      &ClusteringFeatures::tov_per36,
            &ClusteringFeatures::fga_per36,      &ClusteringFeatures::three_pa_per36,
            &ClusteringFeatures::two_pa_per36,   &ClusteringFeatures::fg2_pct,
            &ClusteringFeatures::fg3_pct,        &ClusteringFeatures::ft_pct,
            &ClusteringFeatures::usage_2p,       &ClusteringFeatures::usage_3p,
            &ClusteringFeatures::oer,            &ClusteringFeatures::der,
            &ClusteringFeatures::true_shooting_pct, &ClusteringFeatures::orb_per36,
            &ClusteringFeatures::drb_per36,      &ClusteringFeatures::pf_per36};

// Shot-zone features kept for exploratory analysis only; never fed to the clustering.
struct AuxiliaryFeatures {
    double interior_pct = 0.0;
    double interior_freq = 0.0;
    double exterior_pct = 0.0;
    double exterior_freq = 0.0;

    static constexpr std::size_t kCount = 4;

    static const std::array<double AuxiliaryFeatures::*, kCount> kMembers;

    static constexpr std::array<std::string_view, kCount> kNames = {"interior_pct", "interior_freq", "exterior_pct",
                                                                    "exterior_freq"};

    [[nodiscard]] double operator[](const std::size_t column) const { return this->*kMembers.at(column); }
};

inline const std::array<double AuxiliaryFeatures::*, AuxiliaryFeatures::kCount> AuxiliaryFeatures::kMembers = {
            &AuxiliaryFeatures::interior_pct, &AuxiliaryFeatures::interior_freq, &AuxiliaryFeatures::exterior_pct,
            &AuxiliaryFeatures::exterior_freq};

struct FeatureVector {
    std::string player_id;
    std::string player_name;
    double minutes = 0.0;
    int games = 0;
    bool low_exposure = false;
    // False when the shot-zone counts were not recorded for this player.
    bool has_shot_zones = false;
    ClusteringFeatures clustering;
    AuxiliaryFeatures auxiliary;
};

#endif // FEATURE_VECTOR_HPP
