// File: clustering/model_selector.hpp

#ifndef MODEL_SELECTOR_HPP
#define MODEL_SELECTOR_HPP

#include <Eigen/Dense>
#include <cstdint>

#include "clustering/kmeans.hpp"
#include "common/errors.hpp"
#include "common/logging/logger.hpp"
#include "types/cluster.hpp"

namespace clustering {

    struct SelectionOptions {
        int k_min = 2;
        int k_max = 12;
        std::uint64_t seed = 42;
        KMeansOptions kmeans;
        double min_acceptable_silhouette = 0.1;
    };

    /*
     * Fits one seeded K-Means per candidate K, in parallel, and picks the K with the highest
     * silhouette. Ties go to the smaller K.
     */
    class ModelSelector {
    public:
        explicit ModelSelector(SelectionOptions options = {});

        // Throws DegenerateInputError when the population cannot support the smallest candidate K.
        [[nodiscard]] ModelSelection select(const Eigen::MatrixXd &scaled) const;

        [[nodiscard]] static Eigen::Index distinctRows(const Eigen::MatrixXd &matrix);

    private:
        SelectionOptions options_;

        [[nodiscard]] CandidateScore evaluate(const Eigen::MatrixXd &scaled, int k) const;
    };

} // namespace clustering

#endif // MODEL_SELECTOR_HPP
