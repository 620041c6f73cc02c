// File: types/stability_report.hpp

#ifndef STABILITY_REPORT_HPP
#define STABILITY_REPORT_HPP

#include <cstdint>
#include <vector>

struct AgreementSummary {
    double mean = 0.0;
    double standard_deviation = 0.0; // Population standard deviation.
    double min = 0.0;
    double median = 0.0;
    double max = 0.0;
};

/*
 * Outcome of the repeated-seed clustering study. Read-only with respect to the production
 * assignments: the runs here never feed back into any published label.
 */
struct StabilityReport {
    int k = 0;
    int repetitions = 0;
    std::vector<std::uint64_t> seeds;
    // Adjusted Rand index of every unordered pair of runs, in (i, j) i < j order.
    std::vector<double> pairwise_scores;
    // Adjusted Rand index of each run against the reference labeling.
    std::vector<double> reference_scores;
    bool reference_is_production = false;
    AgreementSummary pairwise;
    AgreementSummary against_reference;
    double threshold = 0.9;
    bool stable = false; // pairwise.mean >= threshold
    std::vector<std::vector<int>> run_labels; // Empty unless requested.
};

#endif // STABILITY_REPORT_HPP
