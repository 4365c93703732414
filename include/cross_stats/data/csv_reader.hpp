// include/cross_stats/data/csv_reader.hpp
#pragma once

#include <istream>
#include <string>
#include <vector>
#include "cross_stats/core/error.hpp"
#include "cross_stats/core/types.hpp"

namespace cross_stats {

/**
 * @brief Splits delimited text into records of string fields
 *
 * Knows nothing about column meaning. Quoted fields may contain the
 * delimiter, line breaks and doubled quotes. A leading UTF-8 BOM is skipped.
 */
class CsvReader {
public:
    explicit CsvReader(char delimiter = ',');

    /**
     * @brief Read every record from a stream
     * @return All records in source order, or FILE_IO_ERROR if the stream fails
     */
    Result<std::vector<RawRecord>> read_stream(std::istream& input) const;

    /**
     * @brief Read every record from a file
     * @return FILE_NOT_FOUND if the file cannot be opened
     */
    Result<std::vector<RawRecord>> read_file(const std::string& path) const;

    /**
     * @brief Split a single record that starts at the current stream position
     * @param input Stream positioned at the start of a record
     * @param record Output fields; cleared first
     * @return false once the stream is exhausted and nothing was read
     */
    bool read_record(std::istream& input, RawRecord& record) const;

    char delimiter() const {
        return delimiter_;
    }

private:
    char delimiter_;
};

}  // namespace cross_stats
