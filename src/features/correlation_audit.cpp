// File: features/correlation_audit.cpp

#include "features/correlation_audit.hpp"

#include <cmath>
#include <stdexcept>
#include <utility>

namespace features {

    CorrelationAudit::CorrelationAudit(const double cutoff) : cutoff_(cutoff) {
        if (cutoff_ < 0.0 || cutoff_ > 1.0) {
            throw std::invalid_argument("Correlation cutoff must lie in [0, 1].");
        }
    }

    double CorrelationAudit::pearson(const Eigen::Ref<const Eigen::VectorXd> &x,
                                     const Eigen::Ref<const Eigen::VectorXd> &y) {
        if (x.size() != y.size()) {
            throw std::invalid_argument("Correlated columns must have the same length.");
        }
        if (x.size() < 2) {
            return 0.0;
        }

        const Eigen::VectorXd dx = x.array() - x.mean();
        const Eigen::VectorXd dy = y.array() - y.mean();
        const double denominator = std::sqrt(dx.squaredNorm() * dy.squaredNorm());
        if (denominator <= 0.0) {
            return 0.0;
        }
        return dx.dot(dy) / denominator;
    }

    std::vector<CorrelationFinding> CorrelationAudit::run(const std::vector<FeatureVector> &features) const {
        const auto n = static_cast<Eigen::Index>(features.size());

        Eigen::MatrixXd clustering(n, static_cast<Eigen::Index>(ClusteringFeatures::kCount));
        Eigen::MatrixXd auxiliary(n, static_cast<Eigen::Index>(AuxiliaryFeatures::kCount));
        for (Eigen::Index i = 0; i < n; ++i) {
            const auto &row = features[static_cast<std::size_t>(i)];
            clustering.row(i) = row.clustering.toRow();
            for (std::size_t j = 0; j < AuxiliaryFeatures::kCount; ++j) {
                auxiliary(i, static_cast<Eigen::Index>(j)) = row.auxiliary[j];
            }
        }

        std::vector<CorrelationFinding> findings;
        findings.reserve(AuxiliaryFeatures::kCount);

        for (std::size_t a = 0; a < AuxiliaryFeatures::kCount; ++a) {
            CorrelationFinding finding;
            finding.feature = std::string(AuxiliaryFeatures::kNames[a]);

            for (std::size_t c = 0; c < ClusteringFeatures::kCount; ++c) {
                const double r = pearson(auxiliary.col(static_cast<Eigen::Index>(a)),
                                         clustering.col(static_cast<Eigen::Index>(c)));
                if (finding.strongest_partner.empty() || std::abs(r) > std::abs(finding.correlation)) {
                    finding.strongest_partner = std::string(ClusteringFeatures::kNames[c]);
                    finding.correlation = r;
                }
            }
            finding.redundant = std::abs(finding.correlation) > cutoff_;

            LOG_INFO("Auxiliary feature '{}': strongest partner '{}' (r = {:.3f}){}", finding.feature,
                     finding.strongest_partner, finding.correlation,
                     finding.redundant ? ", redundant with the clustering set" : "");
            findings.push_back(std::move(finding));
        }

        return findings;
    }

} // namespace features
