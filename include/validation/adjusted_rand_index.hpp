// File: validation/adjusted_rand_index.hpp

#ifndef ADJUSTED_RAND_INDEX_HPP
#define ADJUSTED_RAND_INDEX_HPP

#include <cstdint>
#include <map>
#include <stdexcept>
#include <utility>
#include <vector>

#include "types/concepts.hpp"

namespace validation {

    namespace detail {
        inline double pairs(const std::int64_t count) noexcept {
            return static_cast<double>(count) * static_cast<double>(count - 1) / 2.0;
        }
    } // namespace detail

    /*
     * Chance-adjusted agreement of two labelings of the same items (Hubert & Arabie).
     * 1 for identical partitions up to renaming, about 0 for independent ones, negative below chance.
     * When both partitions are trivial in the same way (one cluster, or all singletons) the index is 1.
     */
    template<Integral Label>
    [[nodiscard]] double adjustedRandIndex(const std::vector<Label> &first, const std::vector<Label> &second) {
        if (first.size() != second.size()) {
            throw std::invalid_argument("Adjusted Rand index needs two labelings of the same items.");
        }
        const auto n = static_cast<std::int64_t>(first.size());
        if (n < 2) {
            return 1.0;
        }

        std::map<std::pair<Label, Label>, std::int64_t> contingency;
        std::map<Label, std::int64_t> first_counts;
        std::map<Label, std::int64_t> second_counts;
        for (std::size_t i = 0; i < first.size(); ++i) {
            ++contingency[{first[i], second[i]}];
            ++first_counts[first[i]];
            ++second_counts[second[i]];
        }

        double index = 0.0;
        for (const auto &[cell, count]: contingency) {
            index += detail::pairs(count);
        }
        double first_sum = 0.0;
        for (const auto &[label, count]: first_counts) {
            first_sum += detail::pairs(count);
        }
        double second_sum = 0.0;
        for (const auto &[label, count]: second_counts) {
            second_sum += detail::pairs(count);
        }

        const double expected = first_sum * second_sum / detail::pairs(n);
        const double maximum = 0.5 * (first_sum + second_sum);
        if (maximum == expected) {
            return 1.0;
        }
        return (index - expected) / (maximum - expected);
    }

} // namespace validation

#endif // ADJUSTED_RAND_INDEX_HPP
