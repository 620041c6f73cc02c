// File: config/pipeline_config.hpp

#ifndef PIPELINE_CONFIG_HPP
#define PIPELINE_CONFIG_HPP

#include <string>

#include "aggregation/aggregator.hpp"
#include "clustering/clusterer.hpp"
#include "clustering/model_selector.hpp"
#include "config/configuration.hpp"
#include "features/feature_engineer.hpp"
#include "reduction/pca.hpp"
#include "validation/stability_validator.hpp"

namespace config {

    /*
     * Plain value view of the configuration file. Components receive their option structs from
     * here by value and never reach into the Configuration singleton themselves.
     */
    struct PipelineConfig {
        struct Logging {
            std::string level = "info";
            std::string directory = "./logs";
            std::string file = "hoopscluster.log";
        } logging;

        std::string input_records = "data/records.csv";
        std::string output_directory = "output";

        aggregation::EligibilityOptions eligibility{5, 0.0};
        features::FeatureOptions features;
        double correlation_cutoff = 0.6;
        double fill_value = 0.0;
        clustering::SelectionOptions selection;
        clustering::ClustererOptions clusterer;
        reduction::PcaOptions reduction;
        validation::StabilityOptions stability;

        // Keys that are absent keep the defaults above.
        [[nodiscard]] static PipelineConfig fromConfiguration(const Configuration &configuration);

        // Maps the process-wide configuration.
        [[nodiscard]] static PipelineConfig load();
    };

} // namespace config

#endif // PIPELINE_CONFIG_HPP
