// src/analysis/analysis_engine.cpp

#include "cross_stats/analysis/analysis_engine.hpp"
#include <algorithm>
#include <cmath>
#include <unordered_set>
#include "cross_stats/core/logger.hpp"

namespace cross_stats {
namespace analysis {

namespace {

constexpr const char* kComponent = "AnalysisEngine";

// Present values of one column together with the rows they came from
struct PresentColumn {
    std::vector<size_t> rows;
    std::vector<double> values;
};

PresentColumn present_column(const Dataset& dataset, size_t column) {
    PresentColumn out;
    for (size_t r = 0; r < dataset.row_count(); ++r) {
        const NumericCell& cell = dataset.cell(r, column);
        if (cell) {
            out.rows.push_back(r);
            out.values.push_back(*cell);
        }
    }
    return out;
}

}  // namespace

const NumericCell* EntityRecord::find(const std::string& feature) const {
    for (const auto& [name, cell] : features) {
        if (name == feature) {
            return &cell;
        }
    }
    return nullptr;
}

Result<BasicStatistics> AnalysisEngine::basic_statistics(const Dataset& dataset,
                                                         const std::string& feature) {
    auto column = dataset.column_index().resolve(feature);
    if (column.is_error()) {
        return forward_error<BasicStatistics>(column, kComponent);
    }

    auto values = statistics::present_values(dataset.column(column.value()));
    return Result<BasicStatistics>(statistics::summarize(values));
}

Result<std::vector<RankedEntity>> AnalysisEngine::ranked(const Dataset& dataset,
                                                         const std::string& feature, size_t n,
                                                         bool descending) {
    auto column = dataset.column_index().resolve(feature);
    if (column.is_error()) {
        return forward_error<std::vector<RankedEntity>>(column, kComponent);
    }

    std::vector<RankedEntity> ranking;
    for (size_t r = 0; r < dataset.row_count(); ++r) {
        const NumericCell& cell = dataset.cell(r, column.value());
        if (cell) {
            ranking.emplace_back(dataset.entity_names()[r], *cell);
        }
    }

    if (descending) {
        std::stable_sort(ranking.begin(), ranking.end(),
                         [](const auto& a, const auto& b) { return a.second > b.second; });
    } else {
        std::stable_sort(ranking.begin(), ranking.end(),
                         [](const auto& a, const auto& b) { return a.second < b.second; });
    }

    if (ranking.size() > n) {
        ranking.resize(n);
    }
    return Result<std::vector<RankedEntity>>(std::move(ranking));
}

Result<std::vector<RankedEntity>> AnalysisEngine::top_n(const Dataset& dataset,
                                                        const std::string& feature, size_t n) {
    return ranked(dataset, feature, n, true);
}

Result<std::vector<RankedEntity>> AnalysisEngine::bottom_n(const Dataset& dataset,
                                                           const std::string& feature,
                                                           size_t n) {
    return ranked(dataset, feature, n, false);
}

RegionSubset AnalysisEngine::filter_by_region(const Dataset& dataset,
                                              const std::string& category) {
    RegionSubset subset;
    for (size_t r = 0; r < dataset.row_count(); ++r) {
        if (dataset.category_labels()[r] == category) {
            subset.row_indices.push_back(r);
            subset.entity_names.push_back(dataset.entity_names()[r]);
            subset.rows.push_back(dataset.row(r));
        }
    }
    return subset;
}

Result<CorrelationMatrix> AnalysisEngine::correlation_matrix(
    const Dataset& dataset, const std::vector<std::string>& features) {
    std::vector<size_t> columns;
    columns.reserve(features.size());
    for (const auto& feature : features) {
        auto column = dataset.column_index().resolve(feature);
        if (column.is_error()) {
            return forward_error<CorrelationMatrix>(column, kComponent);
        }
        columns.push_back(column.value());
    }

    // Complete-case rows: every selected cell present
    std::vector<size_t> complete;
    for (size_t r = 0; r < dataset.row_count(); ++r) {
        bool has_gap = std::any_of(columns.begin(), columns.end(),
                                   [&](size_t c) { return !dataset.cell(r, c).has_value(); });
        if (!has_gap) {
            complete.push_back(r);
        }
    }

    Eigen::MatrixXd samples(static_cast<Eigen::Index>(complete.size()),
                            static_cast<Eigen::Index>(columns.size()));
    for (size_t i = 0; i < complete.size(); ++i) {
        for (size_t j = 0; j < columns.size(); ++j) {
            samples(static_cast<Eigen::Index>(i), static_cast<Eigen::Index>(j)) =
                *dataset.cell(complete[i], columns[j]);
        }
    }

    if (complete.empty()) {
        WARN("No complete rows across " << features.size()
                                        << " feature(s); correlation matrix is undefined");
    }

    CorrelationMatrix result;
    result.features = features;
    result.values = statistics::pearson_matrix(samples);
    result.complete_rows = complete.size();
    return Result<CorrelationMatrix>(std::move(result));
}

Result<PairwiseCorrelation> AnalysisEngine::pairwise_correlation(const Dataset& dataset,
                                                                 const std::string& feature_a,
                                                                 const std::string& feature_b) {
    auto column_a = dataset.column_index().resolve(feature_a);
    if (column_a.is_error()) {
        return forward_error<PairwiseCorrelation>(column_a, kComponent);
    }
    auto column_b = dataset.column_index().resolve(feature_b);
    if (column_b.is_error()) {
        return forward_error<PairwiseCorrelation>(column_b, kComponent);
    }

    std::vector<double> x;
    std::vector<double> y;
    for (size_t r = 0; r < dataset.row_count(); ++r) {
        const NumericCell& a = dataset.cell(r, column_a.value());
        const NumericCell& b = dataset.cell(r, column_b.value());
        if (a && b) {
            x.push_back(*a);
            y.push_back(*b);
        }
    }

    PairwiseCorrelation result;
    result.observations = x.size();
    result.r = statistics::pearson(x, y);
    return Result<PairwiseCorrelation>(result);
}

Result<RegionComparison> AnalysisEngine::compare_regions(const Dataset& dataset,
                                                         const std::string& feature) {
    auto column = dataset.column_index().resolve(feature);
    if (column.is_error()) {
        return forward_error<RegionComparison>(column, kComponent);
    }

    std::map<std::string, std::vector<double>> grouped;
    for (size_t r = 0; r < dataset.row_count(); ++r) {
        const NumericCell& cell = dataset.cell(r, column.value());
        if (cell) {
            grouped[dataset.category_labels()[r]].push_back(*cell);
        }
    }

    RegionComparison comparison;
    for (const auto& [label, values] : grouped) {
        statistics::Summary summary = statistics::summarize(values);
        comparison[label] = RegionStatistics{summary.mean, summary.median, summary.std_dev,
                                             summary.count};
    }
    return Result<RegionComparison>(std::move(comparison));
}

std::vector<std::pair<std::string, RegionStatistics>> AnalysisEngine::sort_by_mean_descending(
    const RegionComparison& comparison) {
    std::vector<std::pair<std::string, RegionStatistics>> ordered(comparison.begin(),
                                                                  comparison.end());
    std::stable_sort(ordered.begin(), ordered.end(), [](const auto& a, const auto& b) {
        return a.second.mean > b.second.mean;
    });
    return ordered;
}

Result<std::vector<Outlier>> AnalysisEngine::find_outliers(const Dataset& dataset,
                                                           const std::string& feature,
                                                           double threshold) {
    auto column = dataset.column_index().resolve(feature);
    if (column.is_error()) {
        return forward_error<std::vector<Outlier>>(column, kComponent);
    }

    PresentColumn present = present_column(dataset, column.value());
    const double mean = statistics::mean(present.values);
    const double std_dev = statistics::population_std(present.values, mean);

    std::vector<Outlier> outliers;
    if (!(std_dev > 0.0)) {
        DEBUG("'" << feature << "' has zero or undefined standard deviation; "
                  << "z-scores are undefined and no outliers are reported");
        return Result<std::vector<Outlier>>(std::move(outliers));
    }

    for (size_t i = 0; i < present.values.size(); ++i) {
        const double z = std::abs(present.values[i] - mean) / std_dev;
        if (z > threshold) {
            outliers.push_back(
                Outlier{dataset.entity_names()[present.rows[i]], present.values[i], z});
        }
    }
    return Result<std::vector<Outlier>>(std::move(outliers));
}

Result<EntityRecord> AnalysisEngine::get_entity_record(const Dataset& dataset,
                                                       const std::string& name) {
    auto row = dataset.find_entity(name);
    if (!row) {
        return make_error<EntityRecord>(ErrorCode::ENTITY_NOT_FOUND,
                                        "Unknown entity: '" + name + "'", kComponent);
    }

    EntityRecord record;
    record.entity_column = dataset.entity_column_name();
    record.category_column = dataset.category_column_name();
    record.entity_name = dataset.entity_names()[*row];
    record.category_label = dataset.category_labels()[*row];
    // A repeated feature name appears once, holding the column it resolves to
    std::unordered_set<std::string> seen;
    for (const auto& feature : dataset.feature_names()) {
        if (!seen.insert(feature).second) {
            continue;
        }
        auto column = dataset.column_index().resolve(feature);
        if (column.is_error()) {
            return forward_error<EntityRecord>(column, kComponent);
        }
        record.features.emplace_back(feature, dataset.cell(*row, column.value()));
    }
    return Result<EntityRecord>(std::move(record));
}

Result<double> AnalysisEngine::percentile_rank(const Dataset& dataset, const std::string& name,
                                               const std::string& feature) {
    auto column = dataset.column_index().resolve(feature);
    if (column.is_error()) {
        return forward_error<double>(column, kComponent);
    }

    auto row = dataset.find_entity(name);
    if (!row) {
        return make_error<double>(ErrorCode::ENTITY_NOT_FOUND, "Unknown entity: '" + name + "'",
                                  kComponent);
    }

    const NumericCell& own = dataset.cell(*row, column.value());
    if (!own) {
        return Result<double>(kNaN);
    }

    auto values = statistics::present_values(dataset.column(column.value()));
    const auto below = std::count_if(values.begin(), values.end(),
                                     [&](double v) { return v < *own; });
    return Result<double>(100.0 * static_cast<double>(below) /
                          static_cast<double>(values.size()));
}

}  // namespace analysis
}  // namespace cross_stats
