// File: features/correlation_audit.hpp

#ifndef CORRELATION_AUDIT_HPP
#define CORRELATION_AUDIT_HPP

#include <Eigen/Core>
#include <string>
#include <vector>

#include "common/logging/logger.hpp"
#include "types/feature_vector.hpp"

namespace features {

    struct CorrelationFinding {
        std::string feature;
        std::string strongest_partner;
        double correlation = 0.0; // Signed Pearson r against the strongest partner.
        bool redundant = false;
    };

    /*
     * Documents why the shot-zone features stay out of the clustering input: each one is
     * correlated against every clustering feature and flagged once |r| exceeds the cutoff.
     * The cutoff only sets CorrelationFinding::redundant for reporting; no feature is ever
     * added to or removed from the clustering input because of it.
     */
    class CorrelationAudit {
    public:
        explicit CorrelationAudit(double cutoff = 0.6);

        [[nodiscard]] std::vector<CorrelationFinding> run(const std::vector<FeatureVector> &features) const;

        // Pearson correlation of two equally sized columns; 0 if either column is constant.
        [[nodiscard]] static double pearson(const Eigen::Ref<const Eigen::VectorXd> &x,
                                            const Eigen::Ref<const Eigen::VectorXd> &y);

    private:
        double cutoff_;
    };

} // namespace features

#endif // CORRELATION_AUDIT_HPP
