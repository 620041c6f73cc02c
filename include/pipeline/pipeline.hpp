// File: pipeline/pipeline.hpp

#ifndef PIPELINE_HPP
#define PIPELINE_HPP

#include <Eigen/Dense>
#include <cstddef>
#include <stop_token>
#include <string_view>
#include <vector>

#include "aggregation/aggregator.hpp"
#include "config/pipeline_config.hpp"
#include "features/correlation_audit.hpp"
#include "preprocessing/standard_scaler.hpp"
#include "reduction/pca.hpp"
#include "types/cluster.hpp"
#include "types/feature_vector.hpp"
#include "types/raw_record.hpp"
#include "types/stability_report.hpp"

namespace pipeline {

    struct PipelineResult {
        std::size_t records_read = 0;
        std::size_t records_skipped = 0;
        std::vector<aggregation::ExcludedPlayer> excluded;
        std::vector<FeatureVector> features; // Row order of every matrix below.
        std::vector<features::CorrelationFinding> correlation;
        preprocessing::ScaledMatrix scaled;
        ModelSelection selection;
        ClusterModel model;
        std::vector<ClusterAssignment> assignments;
        reduction::Projection projection;
        StabilityReport stability;
    };

    /*
     * Runs the stages strictly in order:
     *   raw records -> aggregates -> features -> scaled matrix -> (selection -> final labels),
     *   then projection and the stability study on the same scaled matrix.
     * A stop request is honoured at each checkpoint and raises PipelineCancelledError; nothing
     * partial is returned.
     */
    class Pipeline {
    public:
        explicit Pipeline(config::PipelineConfig config);

        [[nodiscard]] PipelineResult run(const std::vector<RawRecord> &records, std::stop_token stop = {}) const;

        // Entry point for already aggregated players; skips the record fold and eligibility filter.
        [[nodiscard]] PipelineResult runFromAggregates(const std::vector<PlayerAggregate> &aggregates,
                                                       std::stop_token stop = {}) const;

        // Throws DegenerateInputError for an empty population or fewer than two non-constant columns.
        static void checkClusterable(const Eigen::MatrixXd &matrix);

    private:
        config::PipelineConfig config_;

        static void checkpoint(const std::stop_token &stop, std::string_view name);

        void runFeatureStages(const std::vector<PlayerAggregate> &aggregates, const std::stop_token &stop,
                              PipelineResult &result) const;
    };

} // namespace pipeline

#endif // PIPELINE_HPP
