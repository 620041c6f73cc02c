// File: executor.cpp

#include "executor.hpp"

#include <map>

#include "common/logging/logger.hpp"
#include "common/timer.hpp"
#include "io/artifact_writer.hpp"
#include "io/record_reader.hpp"

void Executor::execute(const config::PipelineConfig &config, std::stop_token stop) {
    try {
        LOG_INFO("Starting player clustering run.");
        Timer timer("run");

        const auto records = io::RecordReader::read(config.input_records);
        const pipeline::Pipeline pipeline(config);
        const auto result = pipeline.run(records, stop);

        std::map<int, int> sizes;
        for (const auto &assignment: result.assignments) {
            ++sizes[assignment.label];
        }
        for (const auto &[label, size]: sizes) {
            LOG_INFO("Profile {}: {} players", label, size);
        }
        for (const auto &excluded: result.excluded) {
            LOG_DEBUG("Excluded '{}': {}", excluded.player_id, excluded.reason);
        }

        writeArtifacts(result, config.output_directory);

        if (!result.selection.acceptable) {
            LOG_WARN("Published profiles are weakly separated (silhouette {:.3f})", result.model.silhouette);
        }
        if (!result.stability.stable) {
            LOG_WARN("Published profiles are unstable across seeds (mean ARI {:.3f} < {:.2f})",
                     result.stability.pairwise.mean, result.stability.threshold);
        }
    } catch (const std::exception &e) {
        LOG_ERROR("Failed to execute clustering run: {}", e.what());
        throw;
    }
}

void Executor::writeArtifacts(const pipeline::PipelineResult &result, const std::filesystem::path &directory) {
    using io::ArtifactWriter;

    ArtifactWriter::writeText(directory / "assignments.csv",
                              ArtifactWriter::assignmentTable(result.features, result.assignments,
                                                              result.scaled.values));
    ArtifactWriter::writeText(directory / "projection.csv",
                              ArtifactWriter::projectionTable(result.assignments, result.projection));
    ArtifactWriter::writeJson(directory / "model.json",
                              ArtifactWriter::modelArtifact(result.model, result.selection, result.scaled.parameters,
                                                            result.correlation));
    ArtifactWriter::writeJson(directory / "stability.json", ArtifactWriter::stabilityReport(result.stability));
}
