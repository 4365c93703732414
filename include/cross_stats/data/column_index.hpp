// include/cross_stats/data/column_index.hpp
#pragma once

#include <string>
#include <unordered_map>
#include <vector>
#include "cross_stats/core/error.hpp"

namespace cross_stats {

/**
 * @brief Number of leading identity columns (entity name, category label)
 * that precede the numeric features in every source row
 */
constexpr size_t kIdentityColumnCount = 2;

/**
 * @brief Maps header names to their position in the numeric matrix
 *
 * Built once from the header row. Stores raw header positions and translates
 * them to matrix offsets only through to_matrix_offset().
 */
class ColumnIndex {
public:
    ColumnIndex() = default;

    /**
     * @brief Build from a full header row, identity columns included
     * A name repeated in the header maps to its last position.
     */
    explicit ColumnIndex(const std::vector<std::string>& header);

    /**
     * @brief Resolve a feature name to its column offset in the numeric matrix
     * @return COLUMN_NOT_FOUND for an unknown name, INVALID_ARGUMENT for an
     *         identity column name
     */
    Result<size_t> resolve(const std::string& name) const;

    bool contains(const std::string& name) const;

    /**
     * @brief Number of distinct header names, identity columns included
     */
    size_t size() const {
        return raw_positions_.size();
    }

    /**
     * @brief Translate a raw header position into a matrix offset
     * @pre raw_position >= kIdentityColumnCount
     */
    static constexpr size_t to_matrix_offset(size_t raw_position) {
        return raw_position - kIdentityColumnCount;
    }

    static constexpr size_t to_raw_position(size_t matrix_offset) {
        return matrix_offset + kIdentityColumnCount;
    }

private:
    std::unordered_map<std::string, size_t> raw_positions_;
};

}  // namespace cross_stats
