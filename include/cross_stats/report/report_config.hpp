// include/cross_stats/report/report_config.hpp
#pragma once

#include <string>
#include <vector>
#include "cross_stats/core/config_base.hpp"
#include "cross_stats/core/logger.hpp"
#include "cross_stats/data/dataset_loader.hpp"

namespace cross_stats {

/**
 * @brief Settings of the fixed happiness report
 *
 * Defaults reproduce the World Happiness Report 2020 walkthrough; a JSON file
 * may override any subset of keys.
 */
struct ReportConfig : public ConfigBase {
    DatasetLoaderConfig dataset;
    LoggerConfig logging;

    std::string target_feature{"Ladder score"};
    size_t ranking_size{10};
    std::vector<std::string> factor_features{
        "Logged GDP per capita",        "Social support", "Healthy life expectancy",
        "Freedom to make life choices", "Generosity",     "Perceptions of corruption"};

    std::string spotlight_entity{"India"};
    std::vector<std::string> spotlight_features{"Ladder score", "Logged GDP per capita",
                                                "Social support", "Healthy life expectancy"};

    std::string outlier_feature{"Logged GDP per capita"};
    double outlier_threshold{2.0};
    size_t outliers_shown{5};

    nlohmann::json to_json() const override;
    void from_json(const nlohmann::json& j) override;
};

}  // namespace cross_stats
