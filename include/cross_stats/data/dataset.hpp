// include/cross_stats/data/dataset.hpp
#pragma once

#include <optional>
#include <string>
#include <vector>
#include "cross_stats/core/error.hpp"
#include "cross_stats/core/types.hpp"
#include "cross_stats/data/column_index.hpp"

namespace cross_stats {

/**
 * @brief Read-only table of entities, their category labels and numeric features
 *
 * Row r describes entity_names()[r]; its category is category_labels()[r] and
 * its numeric cells are row(r), one per entry of feature_names(). Nothing
 * mutates a Dataset after create() returns it, so concurrent readers are safe.
 */
class Dataset {
public:
    Dataset() = default;

    /**
     * @brief Build a dataset from aligned parts
     * @param header Full header row: two identity names followed by feature names
     * @param entity_names One name per row
     * @param category_labels One label per row
     * @param rows One numeric row per entity, each with one cell per feature
     * @return INVALID_DATA when the parts are not aligned
     */
    static Result<Dataset> create(std::vector<std::string> header,
                                  std::vector<std::string> entity_names,
                                  std::vector<std::string> category_labels,
                                  std::vector<NumericRow> rows);

    size_t row_count() const {
        return entity_names_.size();
    }

    size_t feature_count() const {
        return feature_names_.size();
    }

    const std::vector<std::string>& header() const {
        return header_;
    }

    const std::string& entity_column_name() const {
        return header_[0];
    }

    const std::string& category_column_name() const {
        return header_[1];
    }

    const std::vector<std::string>& entity_names() const {
        return entity_names_;
    }

    const std::vector<std::string>& category_labels() const {
        return category_labels_;
    }

    const std::vector<std::string>& feature_names() const {
        return feature_names_;
    }

    const ColumnIndex& column_index() const {
        return column_index_;
    }

    const NumericRow& row(size_t row) const {
        return rows_[row];
    }

    const NumericCell& cell(size_t row, size_t column) const {
        return rows_[row][column];
    }

    /**
     * @brief Copy of one matrix column, MISSING cells included
     */
    std::vector<NumericCell> column(size_t column) const;

    /**
     * @brief Row of the first entity whose name equals `name` exactly
     */
    std::optional<size_t> find_entity(const std::string& name) const;

    /**
     * @brief Distinct category labels in lexicographic order
     */
    std::vector<std::string> distinct_categories() const;

private:
    std::vector<std::string> header_;
    std::vector<std::string> feature_names_;
    std::vector<std::string> entity_names_;
    std::vector<std::string> category_labels_;
    std::vector<NumericRow> rows_;
    ColumnIndex column_index_;
};

}  // namespace cross_stats
