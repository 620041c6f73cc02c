// File: pipeline/pipeline.cpp

#include "pipeline/pipeline.hpp"

#include <string>
#include <utility>

#include <fmt/format.h>

#include "clustering/clusterer.hpp"
#include "clustering/model_selector.hpp"
#include "common/errors.hpp"
#include "common/logging/logger.hpp"
#include "common/timer.hpp"
#include "features/feature_engineer.hpp"
#include "validation/stability_validator.hpp"

namespace pipeline {

    Pipeline::Pipeline(config::PipelineConfig config) : config_(std::move(config)) {}

    void Pipeline::checkpoint(const std::stop_token &stop, const std::string_view name) {
        if (stop.stop_requested()) {
            LOG_WARN("Stop requested, abandoning the run at checkpoint '{}'", name);
            throw errors::PipelineCancelledError(std::string(name));
        }
        LOG_DEBUG("Checkpoint '{}' reached", name);
    }

    void Pipeline::checkClusterable(const Eigen::MatrixXd &matrix) {
        if (matrix.rows() == 0) {
            throw errors::DegenerateInputError("No eligible players left to cluster.");
        }

        int varying = 0;
        for (Eigen::Index j = 0; j < matrix.cols(); ++j) {
            if (matrix.col(j).maxCoeff() != matrix.col(j).minCoeff()) {
                ++varying;
            }
        }
        if (varying < 2) {
            throw errors::DegenerateInputError(
                    fmt::format("Only {} of {} feature columns vary across the population.", varying, matrix.cols()));
        }
    }

    PipelineResult Pipeline::run(const std::vector<RawRecord> &records, std::stop_token stop) const {
        try {
            PipelineResult result;
            std::vector<PlayerAggregate> eligible;
            {
                Timer timer("aggregation");
                const auto aggregated = aggregation::Aggregator::aggregate(records);
                result.records_read = aggregated.records_read;
                result.records_skipped = aggregated.records_skipped;
                eligible = aggregation::Aggregator::filterEligible(aggregated, config_.eligibility, result.excluded);
            }
            checkpoint(stop, "aggregates");

            runFeatureStages(eligible, stop, result);
            return result;
        } catch (const errors::PipelineError &e) {
            LOG_ERROR("Pipeline run failed: {}", e.what());
            throw;
        }
    }

    PipelineResult Pipeline::runFromAggregates(const std::vector<PlayerAggregate> &aggregates,
                                               std::stop_token stop) const {
        try {
            PipelineResult result;
            checkpoint(stop, "aggregates");
            runFeatureStages(aggregates, stop, result);
            return result;
        } catch (const errors::PipelineError &e) {
            LOG_ERROR("Pipeline run failed: {}", e.what());
            throw;
        }
    }

    void Pipeline::runFeatureStages(const std::vector<PlayerAggregate> &aggregates, const std::stop_token &stop,
                                    PipelineResult &result) const {
        {
            Timer timer("features");
            const features::FeatureEngineer engineer(config_.features);
            result.features = engineer.computeAll(aggregates, result.excluded);
            if (result.features.size() >= 2) {
                result.correlation = features::CorrelationAudit(config_.correlation_cutoff).run(result.features);
            }
        }
        checkpoint(stop, "features");

        {
            Timer timer("scaling");
            const auto raw = preprocessing::StandardScaler::toMatrix(result.features);
            checkClusterable(raw);
            result.scaled = preprocessing::StandardScaler(config_.fill_value).fitTransform(raw);
        }
        checkpoint(stop, "scaled matrix");

        const auto &scaled = result.scaled.values;
        std::vector<std::string> player_ids;
        player_ids.reserve(result.features.size());
        for (const auto &feature: result.features) {
            player_ids.push_back(feature.player_id);
        }

        const clustering::Clusterer clusterer(config_.clusterer);
        {
            Timer timer("clustering");
            result.selection = clustering::ModelSelector(config_.selection).select(scaled);
            auto fitted = clusterer.fit(scaled, player_ids, result.selection.selected_k);
            result.model = std::move(fitted.model);
            result.assignments = std::move(fitted.assignments);
        }
        checkpoint(stop, "assignments");

        {
            Timer timer("projection");
            result.projection = reduction::PCA(config_.reduction).fit(scaled);
        }

        {
            Timer timer("stability");
            std::vector<int> production(result.assignments.size());
            for (std::size_t i = 0; i < result.assignments.size(); ++i) {
                production[i] = result.assignments[i].label;
            }
            const validation::StabilityValidator validator(clusterer, config_.stability);
            result.stability = validator.validate(scaled, result.model.k, production);
        }

        LOG_INFO("Clustered {} players into {} profiles (silhouette {:.3f}, stability {:.3f}); {} players excluded",
                 result.assignments.size(), result.model.k, result.model.silhouette, result.stability.pairwise.mean,
                 result.excluded.size());
    }

} // namespace pipeline
