// File: config/pipeline_config.cpp

#include "config/pipeline_config.hpp"

#include <cstdint>
#include <vector>

namespace config {

    PipelineConfig PipelineConfig::fromConfiguration(const Configuration &configuration) {
        PipelineConfig pipeline;
        const auto &c = configuration;

        auto &logging = pipeline.logging;
        logging.level = c.get("logging.level", logging.level.c_str());
        logging.directory = c.get("logging.directory", logging.directory.c_str());
        logging.file = c.get("logging.file", logging.file.c_str());

        pipeline.input_records = c.get("input.records", pipeline.input_records.c_str());
        pipeline.output_directory = c.get("output.directory", pipeline.output_directory.c_str());

        auto &eligibility = pipeline.eligibility;
        eligibility.min_games = c.get("aggregation.min_games", eligibility.min_games);
        eligibility.min_minutes = c.get("aggregation.min_minutes", eligibility.min_minutes);

        auto &features = pipeline.features;
        features.exposure_minutes = c.get("features.exposure_minutes", features.exposure_minutes);
        features.free_throw_factor = c.get("features.free_throw_factor", features.free_throw_factor);
        auto &weights = features.weights;
        weights.points = c.get("features.efficiency.offensive.points", weights.points);
        weights.assists = c.get("features.efficiency.offensive.assists", weights.assists);
        weights.offensive_rebounds =
                c.get("features.efficiency.offensive.offensive_rebounds", weights.offensive_rebounds);
        weights.turnovers = c.get("features.efficiency.offensive.turnovers", weights.turnovers);
        weights.steals = c.get("features.efficiency.defensive.steals", weights.steals);
        weights.blocks = c.get("features.efficiency.defensive.blocks", weights.blocks);
        weights.defensive_rebounds =
                c.get("features.efficiency.defensive.defensive_rebounds", weights.defensive_rebounds);
        weights.personal_fouls = c.get("features.efficiency.defensive.personal_fouls", weights.personal_fouls);

        pipeline.correlation_cutoff = c.get("features.correlation_cutoff", pipeline.correlation_cutoff);
        pipeline.fill_value = c.get("scaler.fill_value", pipeline.fill_value);

        // The selector and the final clusterer share the seed and the K-Means budget.
        const auto seed = c.get<std::uint64_t>("clustering.seed", 42);
        clustering::KMeansOptions kmeans;
        kmeans.max_iterations = c.get("clustering.max_iterations", kmeans.max_iterations);
        kmeans.restarts = c.get("clustering.restarts", kmeans.restarts);

        auto &selection = pipeline.selection;
        selection.k_min = c.get("clustering.k_min", selection.k_min);
        selection.k_max = c.get("clustering.k_max", selection.k_max);
        selection.seed = seed;
        selection.kmeans = kmeans;
        selection.min_acceptable_silhouette =
                c.get("clustering.min_acceptable_silhouette", selection.min_acceptable_silhouette);

        auto &clusterer = pipeline.clusterer;
        clusterer.seed = seed;
        clusterer.kmeans = kmeans;
        clusterer.canonical_feature = c.get("clustering.canonical_feature", clusterer.canonical_feature.c_str());

        auto &reduction = pipeline.reduction;
        reduction.components = c.get("reduction.components", reduction.components);
        reduction.variance_curve_components =
                c.get("reduction.variance_curve_components", reduction.variance_curve_components);
        reduction.variance_target = c.get("reduction.variance_target", reduction.variance_target);

        auto &stability = pipeline.stability;
        stability.repetitions = c.get("stability.repetitions", stability.repetitions);
        stability.base_seed = c.get("stability.base_seed", stability.base_seed);
        stability.seeds = c.get("stability.seeds", stability.seeds);
        stability.threshold = c.get("stability.threshold", stability.threshold);
        stability.keep_run_labels = c.get("stability.keep_run_labels", stability.keep_run_labels);

        LOG_DEBUG("Pipeline configuration: K in [{}, {}], seed {}, {} stability runs, exposure {} minutes",
                  selection.k_min, selection.k_max, seed, stability.repetitions, features.exposure_minutes);
        return pipeline;
    }

    PipelineConfig PipelineConfig::load() { return fromConfiguration(Configuration::getInstance()); }

} // namespace config
