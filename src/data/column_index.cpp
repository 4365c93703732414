// src/data/column_index.cpp

#include "cross_stats/data/column_index.hpp"

namespace cross_stats {

ColumnIndex::ColumnIndex(const std::vector<std::string>& header) {
    for (size_t i = 0; i < header.size(); ++i) {
        raw_positions_[header[i]] = i;
    }
}

Result<size_t> ColumnIndex::resolve(const std::string& name) const {
    auto it = raw_positions_.find(name);
    if (it == raw_positions_.end()) {
        return make_error<size_t>(ErrorCode::COLUMN_NOT_FOUND, "Unknown column: '" + name + "'",
                                  "ColumnIndex");
    }
    if (it->second < kIdentityColumnCount) {
        return make_error<size_t>(ErrorCode::INVALID_ARGUMENT,
                                  "Column '" + name + "' is an identity column, not a feature",
                                  "ColumnIndex");
    }
    return Result<size_t>(to_matrix_offset(it->second));
}

bool ColumnIndex::contains(const std::string& name) const {
    return raw_positions_.find(name) != raw_positions_.end();
}

}  // namespace cross_stats
