// src/statistics/statistics_tools.cpp

#include "cross_stats/statistics/statistics_tools.hpp"
#include <algorithm>
#include <cmath>
#include <numeric>

namespace cross_stats {
namespace statistics {

std::vector<double> present_values(const std::vector<NumericCell>& cells) {
    std::vector<double> values;
    values.reserve(cells.size());
    for (const auto& cell : cells) {
        if (cell.has_value()) {
            values.push_back(*cell);
        }
    }
    return values;
}

double mean(const std::vector<double>& values) {
    if (values.empty()) return kNaN;
    return std::accumulate(values.begin(), values.end(), 0.0) / values.size();
}

double median(std::vector<double> values) {
    if (values.empty()) return kNaN;
    size_t n = values.size();
    std::nth_element(values.begin(), values.begin() + n / 2, values.end());
    double upper = values[n / 2];
    if (n % 2 == 0) {
        double lower = *std::max_element(values.begin(), values.begin() + n / 2);
        return (lower + upper) / 2.0;
    }
    return upper;
}

double population_std(const std::vector<double>& values, double mean) {
    if (values.empty()) return kNaN;
    double sum_sq = 0.0;
    for (double val : values) {
        double diff = val - mean;
        sum_sq += diff * diff;
    }
    return std::sqrt(sum_sq / values.size());
}

Summary summarize(const std::vector<double>& values) {
    Summary summary;
    summary.count = values.size();
    if (values.empty()) return summary;

    summary.mean = mean(values);
    summary.median = median(values);
    summary.std_dev = population_std(values, summary.mean);
    auto [min_it, max_it] = std::minmax_element(values.begin(), values.end());
    summary.min = *min_it;
    summary.max = *max_it;
    return summary;
}

Eigen::MatrixXd pearson_matrix(const Eigen::MatrixXd& samples) {
    const Eigen::Index n_vars = samples.cols();
    Eigen::MatrixXd result = Eigen::MatrixXd::Constant(n_vars, n_vars, kNaN);
    if (samples.rows() == 0) {
        return result;
    }

    Eigen::RowVectorXd means = samples.colwise().mean();
    Eigen::MatrixXd centered = samples.rowwise() - means;
    Eigen::MatrixXd scatter = centered.transpose() * centered;

    for (Eigen::Index i = 0; i < n_vars; ++i) {
        result(i, i) = 1.0;
        for (Eigen::Index j = i + 1; j < n_vars; ++j) {
            const double denom = std::sqrt(scatter(i, i) * scatter(j, j));
            double r = kNaN;
            if (denom > 0.0) {
                r = std::clamp(scatter(i, j) / denom, -1.0, 1.0);
            }
            result(i, j) = r;
            result(j, i) = r;
        }
    }
    return result;
}

double pearson(const std::vector<double>& x, const std::vector<double>& y) {
    if (x.size() != y.size() || x.size() < 2) return kNaN;

    Eigen::MatrixXd samples(static_cast<Eigen::Index>(x.size()), 2);
    for (size_t i = 0; i < x.size(); ++i) {
        samples(static_cast<Eigen::Index>(i), 0) = x[i];
        samples(static_cast<Eigen::Index>(i), 1) = y[i];
    }
    return pearson_matrix(samples)(0, 1);
}

}  // namespace statistics
}  // namespace cross_stats
