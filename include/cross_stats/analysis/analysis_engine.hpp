// include/cross_stats/analysis/analysis_engine.hpp
#pragma once

#include <Eigen/Dense>
#include <map>
#include <string>
#include <utility>
#include <vector>
#include "cross_stats/core/error.hpp"
#include "cross_stats/core/types.hpp"
#include "cross_stats/data/dataset.hpp"
#include "cross_stats/statistics/statistics_tools.hpp"

namespace cross_stats {
namespace analysis {

/**
 * @brief Statistics of one feature over its non-missing cells
 */
using BasicStatistics = statistics::Summary;

/**
 * @brief Entities of one category with their full numeric rows
 */
struct RegionSubset {
    std::vector<size_t> row_indices;
    std::vector<std::string> entity_names;
    std::vector<NumericRow> rows;
};

/**
 * @brief Pearson correlation over the complete-case rows of a feature list
 */
struct CorrelationMatrix {
    std::vector<std::string> features;
    Eigen::MatrixXd values;
    size_t complete_rows{0};
};

struct PairwiseCorrelation {
    double r{kNaN};
    size_t observations{0};
};

/**
 * @brief Per-category statistics of one feature
 */
struct RegionStatistics {
    double mean{kNaN};
    double median{kNaN};
    double std_dev{kNaN};
    size_t count{0};
};

using RegionComparison = std::map<std::string, RegionStatistics>;

struct Outlier {
    std::string entity;
    double value{0.0};
    double z_score{0.0};
};

/**
 * @brief Every header field of one entity
 * Identity fields are text; features keep header order and may be MISSING.
 * A feature name repeated in the header appears once, with the cell of the
 * column that name resolves to.
 */
struct EntityRecord {
    std::string entity_column;
    std::string category_column;
    std::string entity_name;
    std::string category_label;
    std::vector<std::pair<std::string, NumericCell>> features;

    /**
     * @brief Cell of a feature, or nullptr when the record has no such feature
     */
    const NumericCell* find(const std::string& feature) const;

    /**
     * @brief Number of fields: both identity fields plus every distinct feature
     */
    size_t size() const {
        return features.size() + 2;
    }
};

/**
 * @brief Read-only queries over a Dataset
 *
 * Every operation borrows the dataset for the duration of the call and never
 * modifies it. Feature names are resolved through the dataset's ColumnIndex;
 * an unknown name is returned as COLUMN_NOT_FOUND. Undefined numeric results
 * (no values, zero variance) are NaN, not errors.
 */
class AnalysisEngine {
public:
    /**
     * @brief Mean, median, population std, min, max and count of a feature
     * All numeric outputs are NaN and count is 0 when the feature has no values.
     */
    static Result<BasicStatistics> basic_statistics(const Dataset& dataset,
                                                    const std::string& feature);

    /**
     * @brief The n entities with the highest values, highest first
     * Ties keep dataset order; MISSING cells are skipped; fewer than n values
     * returns them all.
     */
    static Result<std::vector<RankedEntity>> top_n(const Dataset& dataset,
                                                   const std::string& feature, size_t n);

    /**
     * @brief The n entities with the lowest values, lowest first
     */
    static Result<std::vector<RankedEntity>> bottom_n(const Dataset& dataset,
                                                      const std::string& feature, size_t n);

    /**
     * @brief Entities whose category label equals `category`, in dataset order
     */
    static RegionSubset filter_by_region(const Dataset& dataset, const std::string& category);

    /**
     * @brief Pearson correlation matrix over rows complete in every listed feature
     */
    static Result<CorrelationMatrix> correlation_matrix(const Dataset& dataset,
                                                        const std::vector<std::string>& features);

    /**
     * @brief Pearson r of two features over rows where both are present
     * r is NaN for fewer than two such rows or a constant feature.
     */
    static Result<PairwiseCorrelation> pairwise_correlation(const Dataset& dataset,
                                                            const std::string& feature_a,
                                                            const std::string& feature_b);

    /**
     * @brief Statistics of a feature per category label, ordered by label
     * Categories without any value for the feature are omitted.
     */
    static Result<RegionComparison> compare_regions(const Dataset& dataset,
                                                    const std::string& feature);

    /**
     * @brief Categories of a comparison ordered by descending mean
     */
    static std::vector<std::pair<std::string, RegionStatistics>> sort_by_mean_descending(
        const RegionComparison& comparison);

    /**
     * @brief Entities whose |value - mean| / std exceeds `threshold`, in dataset order
     * A feature with zero standard deviation has no outliers.
     */
    static Result<std::vector<Outlier>> find_outliers(const Dataset& dataset,
                                                      const std::string& feature,
                                                      double threshold = 2.0);

    /**
     * @brief All fields of the first entity named `name`
     * @return ENTITY_NOT_FOUND when no entity has that name
     */
    static Result<EntityRecord> get_entity_record(const Dataset& dataset,
                                                  const std::string& name);

    /**
     * @brief Percentage of present values strictly below the entity's value
     * @return ENTITY_NOT_FOUND for an unknown entity; NaN when its cell is MISSING
     */
    static Result<double> percentile_rank(const Dataset& dataset, const std::string& name,
                                          const std::string& feature);

private:
    static Result<std::vector<RankedEntity>> ranked(const Dataset& dataset,
                                                    const std::string& feature, size_t n,
                                                    bool descending);
};

}  // namespace analysis
}  // namespace cross_stats
