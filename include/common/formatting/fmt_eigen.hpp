// File: common/formatting/fmt_eigen.hpp

#ifndef FMT_EIGEN_HPP
#define FMT_EIGEN_HPP

#include <Eigen/Core>
#include <fmt/format.h>
#include <iomanip>
#include <limits>
#include <sstream>
#include <string>

/*
 * fmt formatter for dense Eigen matrices and vectors.
 * Supports an optional precision followed by 'f' (fixed), 'e' (scientific) or 'g' (general).
 * Column vectors are printed on one line as [a, b, c]; matrices row by row as [[a, b], [c, d]].
 * Example: LOG_DEBUG("Hyperparameters: {:.3e}", params);
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
        std::ostringstream oss;
        oss << std::setprecision(precision >= 0 ? precision : std::numeric_limits<Scalar>::digits10 + 1);
        if (presentation == 'f') {
            oss << std::fixed;
        } else if (presentation == 'e') {
            oss << std::scientific;
        }

        const bool as_vector = mat.cols() == 1;
        oss << '[';
        for (Eigen::Index row = 0; row < mat.rows(); ++row) {
            if (row > 0) {
                oss << ", ";
            }
            if (as_vector) {
                oss << mat(row, 0);
                continue;
            }
            oss << '[';
            for (Eigen::Index col = 0; col < mat.cols(); ++col) {
                if (col > 0) {
                    oss << ", ";
                }
                oss << mat(row, col);
            }
            oss << ']';
        }
        oss << ']';

        return fmt::format_to(ctx.out(), "{}", oss.str());
    }
};

#endif // FMT_EIGEN_HPP
