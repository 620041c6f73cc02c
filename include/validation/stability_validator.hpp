// File: validation/stability_validator.hpp

#ifndef STABILITY_VALIDATOR_HPP
#define STABILITY_VALIDATOR_HPP

#include <Eigen/Dense>
#include <cstdint>
#include <optional>
#include <vector>

#include "clustering/clusterer.hpp"
#include "common/logging/logger.hpp"
#include "types/stability_report.hpp"

namespace validation {

    struct StabilityOptions {
        int repetitions = 50;
        std::uint64_t base_seed = 1000;
        // Used verbatim when non-empty; otherwise the seeds are base_seed + i.
        std::vector<std::uint64_t> seeds;
        double threshold = 0.9;
        bool keep_run_labels = false;
    };

    /*
     * Re-clusters the scaled matrix once per seed, in parallel, and measures how much the
     * canonical labelings agree with each other and with a reference labeling.
     */
    class StabilityValidator {
    public:
        explicit StabilityValidator(clustering::Clusterer clusterer, StabilityOptions options = {});

        // reference_labels: the production assignment; run 0 is the reference when absent.
        [[nodiscard]] StabilityReport validate(const Eigen::MatrixXd &scaled, int k,
                                               const std::optional<std::vector<int>> &reference_labels = {}) const;

        // Explicit seeds, or base_seed + i. Throws std::invalid_argument on duplicates or fewer than two runs.
        [[nodiscard]] std::vector<std::uint64_t> resolveSeeds() const;

        [[nodiscard]] static AgreementSummary summarize(std::vector<double> scores);

    private:
        clustering::Clusterer clusterer_;
        StabilityOptions options_;
    };

} // namespace validation

#endif // STABILITY_VALIDATOR_HPP
