// File: main.cpp

#include <exception>
#include <string>

#include "common/logging/logger.hpp"
#include "config/configuration.hpp"
#include "config/pipeline_config.hpp"
#include "executor.hpp"

int main(const int argc, char *argv[]) {
    const std::string configuration_file = argc > 1 ? argv[1] : "configuration.yaml";

    try {
        config::initialize(configuration_file);
        const auto pipeline_config = config::PipelineConfig::load();
        common::logging::Logger::configure(pipeline_config.logging.directory, pipeline_config.logging.file,
                                           pipeline_config.logging.level);
        config::show();

        Executor::execute(pipeline_config);
    } catch (const std::exception &e) {
        LOG_CRITICAL("hoopscluster terminated: {}", e.what());
        return 1;
    }
    return 0;
}
