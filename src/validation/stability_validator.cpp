// File: validation/stability_validator.cpp

#include "validation/stability_validator.hpp"

#include <algorithm>
#include <cmath>
#include <exception>
#include <execution>
#include <numeric>
#include <set>
#include <stdexcept>
#include <utility>

#include <fmt/format.h>

#include "validation/adjusted_rand_index.hpp"

namespace validation {

    StabilityValidator::StabilityValidator(clustering::Clusterer clusterer, StabilityOptions options) :
        clusterer_(std::move(clusterer)), options_(std::move(options)) {
        if (options_.threshold < -1.0 || options_.threshold > 1.0) {
            throw std::invalid_argument("Stability threshold must lie in [-1, 1].");
        }
    }

    std::vector<std::uint64_t> StabilityValidator::resolveSeeds() const {
        std::vector<std::uint64_t> seeds = options_.seeds;
        if (seeds.empty()) {
            if (options_.repetitions < 2) {
                throw std::invalid_argument("Stability validation needs at least two repetitions.");
            }
            seeds.resize(static_cast<std::size_t>(options_.repetitions));
            std::iota(seeds.begin(), seeds.end(), options_.base_seed);
        }
        if (seeds.size() < 2) {
            throw std::invalid_argument("Stability validation needs at least two seeds.");
        }

        const std::set<std::uint64_t> unique(seeds.begin(), seeds.end());
        if (unique.size() != seeds.size()) {
            LOG_ERROR("Stability seeds contain {} duplicates", seeds.size() - unique.size());
            throw std::invalid_argument("Stability seeds must be distinct.");
        }
        return seeds;
    }

    AgreementSummary StabilityValidator::summarize(std::vector<double> scores) {
        AgreementSummary summary;
        if (scores.empty()) {
            return summary;
        }

        std::sort(scores.begin(), scores.end());
        const auto count = static_cast<double>(scores.size());
        summary.min = scores.front();
        summary.max = scores.back();
        summary.mean = std::accumulate(scores.begin(), scores.end(), 0.0) / count;

        const auto middle = scores.size() / 2;
        summary.median = scores.size() % 2 == 1 ? scores[middle] : 0.5 * (scores[middle - 1] + scores[middle]);

        double squares = 0.0;
        for (const double score: scores) {
            squares += (score - summary.mean) * (score - summary.mean);
        }
        summary.standard_deviation = std::sqrt(squares / count);
        return summary;
    }

    StabilityReport StabilityValidator::validate(const Eigen::MatrixXd &scaled, const int k,
                                                 const std::optional<std::vector<int>> &reference_labels) const {
        if (k < 1 || scaled.rows() < k) {
            LOG_ERROR("Cannot run a stability study of K={} on {} players", k, scaled.rows());
            throw std::invalid_argument(
                    fmt::format("Stability study of K = {} needs at least {} players, got {}.", k, k, scaled.rows()));
        }
        if (scaled.cols() <= clusterer_.canonicalColumn()) {
            throw std::invalid_argument(fmt::format("Scaled matrix has {} columns, the canonical column is {}.",
                                                    scaled.cols(), clusterer_.canonicalColumn()));
        }
        if (!scaled.allFinite()) {
            LOG_ERROR("Stability input contains non-finite values");
            throw std::invalid_argument("Stability input contains non-finite values.");
        }
        if (reference_labels && static_cast<Eigen::Index>(reference_labels->size()) != scaled.rows()) {
            throw std::invalid_argument(fmt::format("Reference labeling has {} entries for {} players",
                                                    reference_labels->size(), scaled.rows()));
        }

        StabilityReport report;
        report.k = k;
        report.seeds = resolveSeeds();
        report.repetitions = static_cast<int>(report.seeds.size());
        report.threshold = options_.threshold;
        report.reference_is_production = reference_labels.has_value();

        LOG_INFO("Stability study: {} runs of K={} on {} players", report.repetitions, k, scaled.rows());

        // Failures are parked per run and rethrown after the join; an exception must not leave a parallel loop.
        std::vector<std::vector<int>> runs(report.seeds.size());
        std::vector<std::exception_ptr> failures(report.seeds.size());
        std::vector<std::size_t> slots(report.seeds.size());
        std::iota(slots.begin(), slots.end(), 0);
        std::for_each(std::execution::par, slots.begin(), slots.end(), [&](const std::size_t slot) {
            try {
                runs[slot] = clusterer_.fitCanonical(scaled, k, report.seeds[slot]).labels;
            } catch (...) {
                failures[slot] = std::current_exception();
            }
        });
        for (const auto &failure: failures) {
            if (failure) {
                std::rethrow_exception(failure);
            }
        }

        std::vector<std::pair<std::size_t, std::size_t>> pairs;
        pairs.reserve(runs.size() * (runs.size() - 1) / 2);
        for (std::size_t i = 0; i < runs.size(); ++i) {
            for (std::size_t j = i + 1; j < runs.size(); ++j) {
                pairs.emplace_back(i, j);
            }
        }
        report.pairwise_scores.resize(pairs.size());
        std::transform(std::execution::par, pairs.begin(), pairs.end(), report.pairwise_scores.begin(),
                       [&runs](const std::pair<std::size_t, std::size_t> &pair) {
                           return adjustedRandIndex(runs[pair.first], runs[pair.second]);
                       });

        const auto &reference = reference_labels ? *reference_labels : runs.front();
        report.reference_scores.reserve(runs.size());
        for (const auto &run: runs) {
            report.reference_scores.push_back(adjustedRandIndex(reference, run));
        }

        report.pairwise = summarize(report.pairwise_scores);
        report.against_reference = summarize(report.reference_scores);
        report.stable = report.pairwise.mean >= report.threshold;
        if (options_.keep_run_labels) {
            report.run_labels = std::move(runs);
        }

        LOG_INFO("Pairwise ARI mean {:.4f} (std {:.4f}, min {:.4f}, median {:.4f}, max {:.4f}); {} at threshold {:.2f}",
                 report.pairwise.mean, report.pairwise.standard_deviation, report.pairwise.min,
                 report.pairwise.median, report.pairwise.max, report.stable ? "stable" : "unstable",
                 report.threshold);
        LOG_INFO("ARI against the {} labeling: mean {:.4f}, min {:.4f}",
                 report.reference_is_production ? "production" : "first-run", report.against_reference.mean,
                 report.against_reference.min);
        return report;
    }

} // namespace validation
