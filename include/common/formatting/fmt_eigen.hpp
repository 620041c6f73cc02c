// File: common/formatting/fmt_eigen.hpp

#ifndef FMT_EIGEN_HPP
#define FMT_EIGEN_HPP

#include <Eigen/Core>
#include <fmt/format.h>
#include <limits>
#include <string>

/*
 * fmt formatter for dense Eigen matrices and vectors.
 * Supports 'f' (fixed-point), 'e' (scientific) and 'g' (general) notation with an optional precision.
 * Vectors are printed inline as [a, b, c]; matrices one row per line.
 * Example: LOG_DEBUG("Centroids:{:.3f}", centroids);
 */
template<typename Scalar, int Rows, int Cols, int Options, int MaxRows, int MaxCols>
struct fmt::formatter<Eigen::Matrix<Scalar, Rows, Cols, Options, MaxRows, MaxCols>> {
    char presentation = 'g';
    int precision = -1;

    constexpr auto parse(fmt::format_parse_context &ctx) {
        auto it = ctx.begin();
        const auto end = ctx.end();

        if (it != end && *it == '.') {
            ++it;
        }
        if (it != end && *it >= '0' && *it <= '9') {
            int parsed_precision = 0;
            while (it != end && *it >= '0' && *it <= '9') {
                parsed_precision = parsed_precision * 10 + (*it - '0');
                ++it;
            }
            precision = parsed_precision;
        }

        if (it != end && *it != '}') {
            presentation = *it++;
        }

        if (presentation != 'f' && presentation != 'e' && presentation != 'g') {
            throw fmt::format_error("Invalid format specifier for Eigen matrix");
        }

        return it;
    }

    template<typename FormatContext>
    auto format(const Eigen::Matrix<Scalar, Rows, Cols, Options, MaxRows, MaxCols> &mat, FormatContext &ctx) const {
        auto out = ctx.out();
        const bool is_vector = mat.rows() == 1 || mat.cols() == 1;

        if (is_vector) {
            *out++ = '[';
            for (Eigen::Index i = 0; i < mat.size(); ++i) {
                if (i != 0) {
                    out = fmt::format_to(out, ", ");
                }
                out = formatScalar(out, mat(i));
            }
            *out++ = ']';
            return out;
        }

        for (Eigen::Index row = 0; row < mat.rows(); ++row) {
            *out++ = '\n';
            for (Eigen::Index col = 0; col < mat.cols(); ++col) {
                if (col != 0) {
                    out = fmt::format_to(out, ", ");
                }
                out = formatScalar(out, mat(row, col));
            }
        }
        return out;
    }

private:
    template<typename OutputIt>
    OutputIt formatScalar(OutputIt out, const Scalar value) const {
        const int digits = precision >= 0 ? precision : std::numeric_limits<Scalar>::digits10;
        switch (presentation) {
            case 'f':
                return fmt::format_to(out, "{:.{}f}", value, digits);
            case 'e':
                return fmt::format_to(out, "{:.{}e}", value, digits);
            default:
                return fmt::format_to(out, "{:.{}g}", value, digits);
        }
    }
};

#endif // FMT_EIGEN_HPP
