#include <algorithm>
#include <cctype>
#include <iostream>
#include <string>
#include "cross_stats/analysis/analysis_engine.hpp"
#include "cross_stats/core/logger.hpp"
#include "cross_stats/data/dataset_loader.hpp"
#include "cross_stats/report/report_config.hpp"
#include "cross_stats/report/report_printer.hpp"

using namespace cross_stats;
using namespace cross_stats::analysis;

namespace {

std::string to_upper(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return text;
}

template <typename T>
bool report_failure(const Result<T>& result, const std::string& step) {
    if (result.is_ok()) {
        return false;
    }
    ERROR(step << " failed: " << result.error()->to_string());
    return true;
}

}  // namespace

int main(int argc, char* argv[]) {
    if (argc > 2) {
        std::cerr << "Usage: " << argv[0] << " [report_config.json]" << std::endl;
        return 1;
    }

    ReportConfig config;
    if (argc == 2) {
        auto loaded = config.load_from_file(argv[1]);
        if (loaded.is_error()) {
            std::cerr << "Failed to load report configuration: " << loaded.error()->to_string()
                      << std::endl;
            return 1;
        }
    }

    try {
        Logger::instance().initialize(config.logging);
    } catch (const std::exception& e) {
        std::cerr << "ERROR: Logger initialization failed: " << e.what() << std::endl;
        return 1;
    }
    Logger::register_component("happiness_report");

    DatasetLoader loader(config.dataset);
    auto dataset_result = loader.load();
    if (report_failure(dataset_result, "Loading " + config.dataset.file_path)) {
        return 1;
    }
    const Dataset& dataset = dataset_result.value();
    INFO("Loaded data: " << dataset.row_count() << " countries, " << dataset.feature_count()
                         << " features");

    const std::string& target = config.target_feature;
    ReportPrinter printer(std::cout);
    printer.print_banner("WORLD HAPPINESS REPORT DATA ANALYSIS");

    printer.print_section(1, "BASIC STATISTICS FOR " + to_upper(target));
    auto stats = AnalysisEngine::basic_statistics(dataset, target);
    if (report_failure(stats, "Basic statistics")) {
        return 1;
    }
    printer.print_basic_statistics(stats.value());

    printer.print_section(2, "TOP " + std::to_string(config.ranking_size) + " BY " +
                                 to_upper(target));
    auto top = AnalysisEngine::top_n(dataset, target, config.ranking_size);
    if (report_failure(top, "Top ranking")) {
        return 1;
    }
    printer.print_ranking(top.value());

    printer.print_section(3, "BOTTOM " + std::to_string(config.ranking_size) + " BY " +
                                 to_upper(target));
    auto bottom = AnalysisEngine::bottom_n(dataset, target, config.ranking_size);
    if (report_failure(bottom, "Bottom ranking")) {
        return 1;
    }
    printer.print_ranking(bottom.value());

    printer.print_section(4, to_upper(target) + " BY REGION");
    auto regions = AnalysisEngine::compare_regions(dataset, target);
    if (report_failure(regions, "Regional comparison")) {
        return 1;
    }
    printer.print_region_means(AnalysisEngine::sort_by_mean_descending(regions.value()));

    printer.print_section(5, "CORRELATION ANALYSIS");
    printer.print_note("Analyzing correlations with " + target + "...");
    for (const auto& factor : config.factor_features) {
        auto corr = AnalysisEngine::pairwise_correlation(dataset, target, factor);
        if (report_failure(corr, "Correlation with " + factor)) {
            return 1;
        }
        if (corr.value().observations > 0) {
            printer.print_correlation(factor, corr.value());
        }
    }

    printer.print_section(6, "DETAILED DATA FOR " + to_upper(config.spotlight_entity));
    auto record = AnalysisEngine::get_entity_record(dataset, config.spotlight_entity);
    if (record.is_ok()) {
        printer.print_entity_record(record.value(), config.spotlight_features);
        auto percentile =
            AnalysisEngine::percentile_rank(dataset, config.spotlight_entity, target);
        if (report_failure(percentile, "Percentile rank")) {
            return 1;
        }
        printer.print_percentile(percentile.value());
    } else if (record.error()->code() == ErrorCode::ENTITY_NOT_FOUND) {
        WARN(record.error()->what());
        printer.print_note("No data for " + config.spotlight_entity);
    } else {
        ERROR("Entity lookup failed: " << record.error()->to_string());
        return 1;
    }

    printer.print_section(7, "OUTLIER DETECTION FOR " + to_upper(config.outlier_feature));
    auto outliers =
        AnalysisEngine::find_outliers(dataset, config.outlier_feature, config.outlier_threshold);
    if (report_failure(outliers, "Outlier detection")) {
        return 1;
    }
    printer.print_outliers(outliers.value(), config.outliers_shown);

    printer.print_footer();
    return 0;
}
