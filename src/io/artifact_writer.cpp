// File: io/artifact_writer.cpp

#include "io/artifact_writer.hpp"

#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <utility>

#include <fmt/format.h>

#include "common/utilities/file_utils.hpp"

namespace io {

    namespace {
        json toJson(const Eigen::MatrixXd &matrix) {
            json rows = json::array();
            for (Eigen::Index i = 0; i < matrix.rows(); ++i) {
                json row = json::array();
                for (Eigen::Index j = 0; j < matrix.cols(); ++j) {
                    row.push_back(matrix(i, j));
                }
                rows.push_back(std::move(row));
            }
            return rows;
        }

        json toJson(const Eigen::RowVectorXd &vector) {
            json values = json::array();
            for (Eigen::Index i = 0; i < vector.size(); ++i) {
                values.push_back(vector(i));
            }
            return values;
        }

        json toJson(const AgreementSummary &summary) {
            return {{"mean", summary.mean},
                    {"std", summary.standard_deviation},
                    {"min", summary.min},
                    {"median", summary.median},
                    {"max", summary.max}};
        }

        json featureNames() {
            json names = json::array();
            for (const auto name: ClusteringFeatures::kNames) {
                names.push_back(std::string(name));
            }
            return names;
        }
    } // namespace

    std::string ArtifactWriter::escape(const std::string &cell) {
        if (cell.find_first_of(",\"\n\r") == std::string::npos) {
            return cell;
        }
        std::string quoted = "\"";
        for (const char ch: cell) {
            if (ch == '"') {
                quoted.push_back('"');
            }
            quoted.push_back(ch);
        }
        quoted.push_back('"');
        return quoted;
    }

    std::string ArtifactWriter::assignmentTable(const std::vector<FeatureVector> &features,
                                                const std::vector<ClusterAssignment> &assignments,
                                                const Eigen::MatrixXd &scaled) {
        if (features.size() != assignments.size() || static_cast<Eigen::Index>(features.size()) != scaled.rows()) {
            throw std::invalid_argument(fmt::format("Assignment table needs aligned rows, got {} features, {} "
                                                    "assignments and {} scaled rows",
                                                    features.size(), assignments.size(), scaled.rows()));
        }

        std::ostringstream out;
        out << std::setprecision(10);
        out << "player_id,player_name,label,distance";
        for (const auto name: ClusteringFeatures::kNames) {
            out << ',' << name;
        }
        for (const auto name: ClusteringFeatures::kNames) {
            out << ",scaled_" << name;
        }
        out << '\n';

        for (std::size_t i = 0; i < features.size(); ++i) {
            const auto &feature = features[i];
            const auto &assignment = assignments[i];
            if (feature.player_id != assignment.player_id) {
                throw std::invalid_argument(fmt::format("Row {} pairs features of '{}' with the assignment of '{}'",
                                                        i, feature.player_id, assignment.player_id));
            }

            out << escape(feature.player_id) << ',' << escape(feature.player_name) << ',' << assignment.label << ','
                << assignment.distance;
            for (std::size_t j = 0; j < ClusteringFeatures::kCount; ++j) {
                out << ',' << feature.clustering[j];
            }
            for (Eigen::Index j = 0; j < scaled.cols(); ++j) {
                out << ',' << scaled(static_cast<Eigen::Index>(i), j);
            }
            out << '\n';
        }
        return out.str();
    }

    std::string ArtifactWriter::projectionTable(const std::vector<ClusterAssignment> &assignments,
                                                const reduction::Projection &projection) {
        if (static_cast<Eigen::Index>(assignments.size()) != projection.coordinates.rows()) {
            throw std::invalid_argument("Projection and assignments differ in player count.");
        }

        std::ostringstream out;
        out << std::setprecision(10);
        out << "player_id,label";
        for (Eigen::Index c = 0; c < projection.coordinates.cols(); ++c) {
            out << ",pc" << c + 1;
        }
        out << '\n';

        for (std::size_t i = 0; i < assignments.size(); ++i) {
            out << escape(assignments[i].player_id) << ',' << assignments[i].label;
            for (Eigen::Index c = 0; c < projection.coordinates.cols(); ++c) {
                out << ',' << projection.coordinates(static_cast<Eigen::Index>(i), c);
            }
            out << '\n';
        }
        return out.str();
    }

    json ArtifactWriter::modelArtifact(const ClusterModel &model, const ModelSelection &selection,
                                       const preprocessing::ScalerParameters &scaler,
                                       const std::vector<features::CorrelationFinding> &correlation) {
        json candidates = json::array();
        for (const auto &candidate: selection.candidates) {
            candidates.push_back({{"k", candidate.k},
                                  {"silhouette", candidate.silhouette},
                                  {"inertia", candidate.inertia},
                                  {"converged", candidate.converged}});
        }

        json audit = json::array();
        for (const auto &finding: correlation) {
            audit.push_back({{"feature", finding.feature},
                             {"strongest_partner", finding.strongest_partner},
                             {"correlation", finding.correlation},
                             {"redundant", finding.redundant}});
        }

        return {{"k", model.k},
                {"feature_names", featureNames()},
                {"canonical_feature", model.canonical_feature},
                {"centroids", toJson(model.centroids)},
                {"cluster_sizes", model.cluster_sizes},
                {"silhouette", model.silhouette},
                {"inertia", model.inertia},
                {"iterations", model.iterations},
                {"converged", model.converged},
                {"seed", model.seed},
                {"scaler", {{"mean", toJson(scaler.mean())}, {"scale", toJson(scaler.scale())}}},
                {"selection",
                 {{"selected_k", selection.selected_k},
                  {"selected_silhouette", selection.selected_silhouette},
                  {"acceptable", selection.acceptable},
                  {"candidates", std::move(candidates)}}},
                {"correlation_audit", std::move(audit)}};
    }

    json ArtifactWriter::stabilityReport(const StabilityReport &report) {
        json document = {{"k", report.k},
                         {"repetitions", report.repetitions},
                         {"seeds", report.seeds},
                         {"threshold", report.threshold},
                         {"stable", report.stable},
                         {"pairwise", toJson(report.pairwise)},
                         {"against_reference", toJson(report.against_reference)},
                         {"reference", report.reference_is_production ? "production" : "first_run"},
                         {"pairwise_scores", report.pairwise_scores},
                         {"reference_scores", report.reference_scores}};
        if (!report.run_labels.empty()) {
            document["run_labels"] = report.run_labels;
        }
        return document;
    }

    void ArtifactWriter::writeJson(const std::filesystem::path &path, const json &document) {
        std::ostringstream out;
        out << std::setw(4) << document << '\n';
        writeText(path, out.str());
    }

    void ArtifactWriter::writeText(const std::filesystem::path &path, const std::string &content) {
        try {
            common::utilities::FileUtils::writeStringToFile(path, content);
        } catch (const std::exception &e) {
            LOG_ERROR("Failed to write artifact {}: {}", path.string(), e.what());
            throw;
        }
        LOG_INFO("Artifact saved to file: {}", path.string());
    }

} // namespace io
