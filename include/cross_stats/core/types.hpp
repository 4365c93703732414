// include/cross_stats/core/types.hpp

#pragma once

#include <cmath>
#include <limits>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace cross_stats {

/**
 * @brief One numeric cell of the dataset
 * An empty optional is MISSING: no valid value was recorded in the source.
 * A present NaN can only come out of a computation, never from loading.
 */
using NumericCell = std::optional<double>;

/**
 * @brief A single row of numeric cells in feature order
 */
using NumericRow = std::vector<NumericCell>;

/**
 * @brief Record type used by the tokenizer: one string per field
 */
using RawRecord = std::vector<std::string>;

/**
 * @brief Entity name paired with its value for one feature
 */
using RankedEntity = std::pair<std::string, double>;

inline constexpr double kNaN = std::numeric_limits<double>::quiet_NaN();

}  // namespace cross_stats
