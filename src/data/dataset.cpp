// src/data/dataset.cpp

#include "cross_stats/data/dataset.hpp"
#include <set>

namespace cross_stats {

Result<Dataset> Dataset::create(std::vector<std::string> header,
                                std::vector<std::string> entity_names,
                                std::vector<std::string> category_labels,
                                std::vector<NumericRow> rows) {
    if (header.size() < kIdentityColumnCount) {
        return make_error<Dataset>(ErrorCode::INVALID_DATA,
                                   "Header must name the entity and category columns",
                                   "Dataset");
    }
    if (entity_names.size() != category_labels.size() || entity_names.size() != rows.size()) {
        return make_error<Dataset>(
            ErrorCode::INVALID_DATA,
            "Row count mismatch: " + std::to_string(entity_names.size()) + " names, " +
                std::to_string(category_labels.size()) + " labels, " +
                std::to_string(rows.size()) + " numeric rows",
            "Dataset");
    }

    const size_t feature_count = header.size() - kIdentityColumnCount;
    for (size_t r = 0; r < rows.size(); ++r) {
        if (rows[r].size() != feature_count) {
            return make_error<Dataset>(ErrorCode::INVALID_DATA,
                                       "Row " + std::to_string(r) + " has " +
                                           std::to_string(rows[r].size()) + " cells, expected " +
                                           std::to_string(feature_count),
                                       "Dataset");
        }
    }

    Dataset dataset;
    dataset.column_index_ = ColumnIndex(header);
    dataset.feature_names_.assign(header.begin() + kIdentityColumnCount, header.end());
    dataset.header_ = std::move(header);
    dataset.entity_names_ = std::move(entity_names);
    dataset.category_labels_ = std::move(category_labels);
    dataset.rows_ = std::move(rows);
    return Result<Dataset>(std::move(dataset));
}

std::vector<NumericCell> Dataset::column(size_t column) const {
    std::vector<NumericCell> values;
    values.reserve(rows_.size());
    for (const auto& row : rows_) {
        values.push_back(row[column]);
    }
    return values;
}

std::optional<size_t> Dataset::find_entity(const std::string& name) const {
    for (size_t r = 0; r < entity_names_.size(); ++r) {
        if (entity_names_[r] == name) {
            return r;
        }
    }
    return std::nullopt;
}

std::vector<std::string> Dataset::distinct_categories() const {
    std::set<std::string> labels(category_labels_.begin(), category_labels_.end());
    return std::vector<std::string>(labels.begin(), labels.end());
}

}  // namespace cross_stats
