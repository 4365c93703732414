// include/cross_stats/data/dataset_loader.hpp
#pragma once

#include <string>
#include <vector>
#include "cross_stats/core/config_base.hpp"
#include "cross_stats/core/error.hpp"
#include "cross_stats/core/types.hpp"
#include "cross_stats/data/dataset.hpp"

namespace cross_stats {

/**
 * @brief Where and how to read the source table
 */
struct DatasetLoaderConfig : public ConfigBase {
    std::string file_path{"WHR20_DataForFigure2.1.csv"};
    char delimiter{','};

    nlohmann::json to_json() const override {
        nlohmann::json j;
        j["file_path"] = file_path;
        j["delimiter"] = std::string(1, delimiter);
        return j;
    }

    void from_json(const nlohmann::json& j) override {
        if (j.contains("file_path"))
            file_path = j.at("file_path").get<std::string>();
        if (j.contains("delimiter")) {
            std::string value = j.at("delimiter").get<std::string>();
            if (value.size() == 1)
                delimiter = value[0];
        }
    }
};

/**
 * @brief Turns raw records into a Dataset
 *
 * Loading is tolerant of bad rows and cells:
 * - rows with two or fewer fields are dropped
 * - numeric fields that do not parse become MISSING
 * - short rows are padded with MISSING, surplus fields are ignored
 * Only an unreadable or empty source is an error.
 */
class DatasetLoader {
public:
    explicit DatasetLoader(DatasetLoaderConfig config);

    /**
     * @brief Read and convert the configured file
     * @return FILE_NOT_FOUND / FILE_IO_ERROR if unreadable, EMPTY_SOURCE if it has no header
     */
    Result<Dataset> load() const;

    /**
     * @brief Convert records whose first entry is the header row
     * @return EMPTY_SOURCE when records is empty
     */
    static Result<Dataset> from_records(const std::vector<RawRecord>& records);

    /**
     * @brief Parse one numeric field; MISSING when empty, non-numeric or NaN
     */
    static NumericCell parse_cell(const std::string& field);

    const DatasetLoaderConfig& config() const {
        return config_;
    }

private:
    DatasetLoaderConfig config_;
};

}  // namespace cross_stats
