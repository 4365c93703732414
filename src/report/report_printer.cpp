// src/report/report_printer.cpp

#include "cross_stats/report/report_printer.hpp"
#include <cmath>
#include <iomanip>
#include <sstream>

namespace cross_stats {

namespace {
constexpr int kBannerWidth = 80;
constexpr int kRuleWidth = 60;
constexpr int kNameWidth = 30;
constexpr int kRegionWidth = 35;
}  // namespace

ReportPrinter::ReportPrinter(std::ostream& out) : out_(out) {}

std::string ReportPrinter::format_number(double value, int precision) {
    if (std::isnan(value)) {
        return "n/a";
    }
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(precision) << value;
    return ss.str();
}

void ReportPrinter::print_banner(const std::string& title) {
    out_ << "\n" << std::string(kBannerWidth, '=') << "\n";
    out_ << title << "\n";
    out_ << std::string(kBannerWidth, '=') << "\n";
}

void ReportPrinter::print_footer() {
    out_ << "\n" << std::string(kBannerWidth, '=') << "\n";
}

void ReportPrinter::print_section(int number, const std::string& title) {
    out_ << "\n" << number << ". " << title << "\n";
    out_ << std::string(kRuleWidth, '-') << "\n";
}

void ReportPrinter::print_basic_statistics(const analysis::BasicStatistics& stats) {
    out_ << "  Mean: " << format_number(stats.mean, 4) << "\n";
    out_ << "  Median: " << format_number(stats.median, 4) << "\n";
    out_ << "  Std: " << format_number(stats.std_dev, 4) << "\n";
    out_ << "  Min: " << format_number(stats.min, 4) << "\n";
    out_ << "  Max: " << format_number(stats.max, 4) << "\n";
    out_ << "  Count: " << stats.count << "\n";
}

void ReportPrinter::print_ranking(const std::vector<RankedEntity>& ranking) {
    for (size_t i = 0; i < ranking.size(); ++i) {
        out_ << "  " << std::right << std::setw(2) << (i + 1) << ". " << std::left
             << std::setw(kNameWidth) << ranking[i].first << " "
             << format_number(ranking[i].second, 3) << "\n";
    }
    out_ << std::right;
}

void ReportPrinter::print_region_means(
    const std::vector<std::pair<std::string, analysis::RegionStatistics>>& regions) {
    for (const auto& [region, stats] : regions) {
        out_ << "  " << std::left << std::setw(kRegionWidth) << region << std::right
             << " Mean: " << format_number(stats.mean, 3) << " (+/-"
             << format_number(stats.std_dev, 3) << ")\n";
    }
}

void ReportPrinter::print_correlation(const std::string& factor,
                                      const analysis::PairwiseCorrelation& corr) {
    out_ << "  " << std::left << std::setw(kRegionWidth) << factor << std::right
         << " r = " << format_number(corr.r, 3) << "\n";
}

void ReportPrinter::print_entity_record(const analysis::EntityRecord& record,
                                        const std::vector<std::string>& features) {
    out_ << "  " << record.entity_column << ": " << record.entity_name << "\n";
    out_ << "  " << record.category_column << ": " << record.category_label << "\n";
    for (const auto& feature : features) {
        const NumericCell* cell = record.find(feature);
        out_ << "  " << feature << ": ";
        if (cell == nullptr) {
            out_ << "unknown feature\n";
        } else if (!cell->has_value()) {
            out_ << "missing\n";
        } else {
            out_ << format_number(**cell, 3) << "\n";
        }
    }
}

void ReportPrinter::print_percentile(double percentile) {
    out_ << "  Percentile rank: " << format_number(percentile, 1)
         << (std::isnan(percentile) ? "" : "%") << "\n";
}

void ReportPrinter::print_outliers(const std::vector<analysis::Outlier>& outliers,
                                   size_t limit) {
    if (outliers.empty()) {
        out_ << "  No outliers found.\n";
        return;
    }
    out_ << "  Found " << outliers.size() << " outliers:\n";
    for (size_t i = 0; i < outliers.size() && i < limit; ++i) {
        out_ << "  " << std::left << std::setw(kNameWidth) << outliers[i].entity << std::right
             << " Value: " << format_number(outliers[i].value, 3)
             << ", Z-score: " << format_number(outliers[i].z_score, 2) << "\n";
    }
}

void ReportPrinter::print_note(const std::string& text) {
    out_ << "  " << text << "\n";
}

}  // namespace cross_stats
