// File: io/artifact_writer.hpp

#ifndef ARTIFACT_WRITER_HPP
#define ARTIFACT_WRITER_HPP

#include <Eigen/Dense>
#include <filesystem>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

#include "common/logging/logger.hpp"
#include "features/correlation_audit.hpp"
#include "preprocessing/standard_scaler.hpp"
#include "reduction/pca.hpp"
#include "types/cluster.hpp"
#include "types/feature_vector.hpp"
#include "types/stability_report.hpp"

namespace io {

    using json = nlohmann::json;

    /*
     * Serializes pipeline outputs: the assignment table and projection as CSV, the model
     * artifact and the stability report as JSON. Rows of features, assignments and the
     * scaled matrix are expected in the same player order.
     */
    class ArtifactWriter {
    public:
        [[nodiscard]] static std::string assignmentTable(const std::vector<FeatureVector> &features,
                                                         const std::vector<ClusterAssignment> &assignments,
                                                         const Eigen::MatrixXd &scaled);

        [[nodiscard]] static std::string projectionTable(const std::vector<ClusterAssignment> &assignments,
                                                         const reduction::Projection &projection);

        [[nodiscard]] static json modelArtifact(const ClusterModel &model, const ModelSelection &selection,
                                                const preprocessing::ScalerParameters &scaler,
                                                const std::vector<features::CorrelationFinding> &correlation);

        [[nodiscard]] static json stabilityReport(const StabilityReport &report);

        static void writeJson(const std::filesystem::path &path, const json &document);

        static void writeText(const std::filesystem::path &path, const std::string &content);

        // Quotes a CSV cell when it contains a comma, a quote or a line break.
        [[nodiscard]] static std::string escape(const std::string &cell);
    };

} // namespace io

#endif // ARTIFACT_WRITER_HPP
