// include/cross_stats/report/report_printer.hpp
#pragma once

#include <ostream>
#include <string>
#include <utility>
#include <vector>
#include "cross_stats/analysis/analysis_engine.hpp"

namespace cross_stats {

/**
 * @brief Plain-text rendering of analysis results
 *
 * Holds no data of its own; every method formats the value it is given.
 * NaN values are printed as "n/a" and MISSING cells as "missing".
 */
class ReportPrinter {
public:
    explicit ReportPrinter(std::ostream& out);

    void print_banner(const std::string& title);
    void print_footer();
    void print_section(int number, const std::string& title);

    void print_basic_statistics(const analysis::BasicStatistics& stats);
    void print_ranking(const std::vector<RankedEntity>& ranking);
    void print_region_means(
        const std::vector<std::pair<std::string, analysis::RegionStatistics>>& regions);
    void print_correlation(const std::string& factor, const analysis::PairwiseCorrelation& corr);
    void print_entity_record(const analysis::EntityRecord& record,
                             const std::vector<std::string>& features);
    void print_percentile(double percentile);
    void print_outliers(const std::vector<analysis::Outlier>& outliers, size_t limit);
    void print_note(const std::string& text);

    /**
     * @brief Fixed-precision number, or "n/a" for NaN
     */
    static std::string format_number(double value, int precision);

private:
    std::ostream& out_;
};

}  // namespace cross_stats
