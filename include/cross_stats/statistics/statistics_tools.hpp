// include/cross_stats/statistics/statistics_tools.hpp

#pragma once

#include <Eigen/Dense>
#include <cstddef>
#include <vector>
#include "cross_stats/core/types.hpp"

namespace cross_stats {
namespace statistics {

// ============================================================================
// Missing-aware reducers
//
// Every reducer works on plain values; callers strip MISSING cells first with
// present_values(). Reducing an empty input yields NaN, never an error.
// ============================================================================

/**
 * @brief Descriptive statistics of one set of values
 */
struct Summary {
    double mean{kNaN};
    double median{kNaN};
    double std_dev{kNaN};  // Population standard deviation (divides by n)
    double min{kNaN};
    double max{kNaN};
    size_t count{0};
};

/**
 * @brief Values of the present cells, in input order
 */
std::vector<double> present_values(const std::vector<NumericCell>& cells);

double mean(const std::vector<double>& values);

/**
 * @brief Median; average of the two middle values for an even count
 */
double median(std::vector<double> values);

/**
 * @brief Population standard deviation around a precomputed mean
 */
double population_std(const std::vector<double>& values, double mean);

Summary summarize(const std::vector<double>& values);

// ============================================================================
// Correlation
// ============================================================================

/**
 * @brief Pearson correlation matrix of the columns of `samples`
 * @param samples Matrix of shape (observations x variables) without gaps
 * @return Symmetric matrix clamped to [-1, 1]. The diagonal is 1 when there is
 *         at least one observation; an off-diagonal entry is NaN when either
 *         variable has zero variance. No observations gives an all-NaN matrix.
 */
Eigen::MatrixXd pearson_matrix(const Eigen::MatrixXd& samples);

/**
 * @brief Pearson correlation of two equally long series
 * @return NaN for fewer than two observations or a constant series
 */
double pearson(const std::vector<double>& x, const std::vector<double>& y);

}  // namespace statistics
}  // namespace cross_stats
