// src/report/report_config.cpp

#include "cross_stats/report/report_config.hpp"

namespace cross_stats {

nlohmann::json ReportConfig::to_json() const {
    nlohmann::json j;
    j["dataset"] = dataset.to_json();
    j["logging"] = logging.to_json();
    j["target_feature"] = target_feature;
    j["ranking_size"] = ranking_size;
    j["factor_features"] = factor_features;
    j["spotlight_entity"] = spotlight_entity;
    j["spotlight_features"] = spotlight_features;
    j["outlier_feature"] = outlier_feature;
    j["outlier_threshold"] = outlier_threshold;
    j["outliers_shown"] = outliers_shown;
    return j;
}

void ReportConfig::from_json(const nlohmann::json& j) {
    if (j.contains("dataset"))
        dataset.from_json(j.at("dataset"));
    if (j.contains("logging"))
        logging.from_json(j.at("logging"));
    if (j.contains("target_feature"))
        target_feature = j.at("target_feature").get<std::string>();
    if (j.contains("ranking_size"))
        ranking_size = j.at("ranking_size").get<size_t>();
    if (j.contains("factor_features"))
        factor_features = j.at("factor_features").get<std::vector<std::string>>();
    if (j.contains("spotlight_entity"))
        spotlight_entity = j.at("spotlight_entity").get<std::string>();
    if (j.contains("spotlight_features"))
        spotlight_features = j.at("spotlight_features").get<std::vector<std::string>>();
    if (j.contains("outlier_feature"))
        outlier_feature = j.at("outlier_feature").get<std::string>();
    if (j.contains("outlier_threshold"))
        outlier_threshold = j.at("outlier_threshold").get<double>();
    if (j.contains("outliers_shown"))
        outliers_shown = j.at("outliers_shown").get<size_t>();
}

}  // namespace cross_stats
