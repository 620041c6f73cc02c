// File: executor.hpp

#ifndef EXECUTOR_HPP
#define EXECUTOR_HPP

#include <filesystem>
#include <stop_token>

#include "config/pipeline_config.hpp"
#include "pipeline/pipeline.hpp"

// Batch job behind the command line: read the records, run the pipeline, publish the artifacts.
class Executor {
public:
    static void execute(const config::PipelineConfig &config, std::stop_token stop = {});

    static void writeArtifacts(const pipeline::PipelineResult &result, const std::filesystem::path &directory);

    Executor(const Executor &) = delete;
    Executor &operator=(const Executor &) = delete;
    Executor(Executor &&) = delete;
    Executor &operator=(Executor &&) = delete;
    ~Executor() = default;

    Executor() = delete;
};

#endif // EXECUTOR_HPP
