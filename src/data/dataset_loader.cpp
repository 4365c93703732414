// src/data/dataset_loader.cpp

#include "cross_stats/data/dataset_loader.hpp"
#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <unordered_set>
#include "cross_stats/core/logger.hpp"
#include "cross_stats/data/csv_reader.hpp"

namespace cross_stats {

namespace {

const char* const kDefaultIdentityNames[kIdentityColumnCount] = {"Country name",
                                                                 "Regional indicator"};

std::string trim(const std::string& value) {
    const size_t begin = value.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return "";
    }
    const size_t end = value.find_last_not_of(" \t\r\n");
    return value.substr(begin, end - begin + 1);
}

bool looks_hexadecimal(const std::string& text) {
    return text.find_first_of("xX") != std::string::npos;
}

}  // namespace

DatasetLoader::DatasetLoader(DatasetLoaderConfig config) : config_(std::move(config)) {}

NumericCell DatasetLoader::parse_cell(const std::string& field) {
    const std::string text = trim(field);
    if (text.empty() || looks_hexadecimal(text)) {
        return std::nullopt;
    }

    char* end = nullptr;
    const double value = std::strtod(text.c_str(), &end);
    if (end != text.c_str() + text.size()) {
        return std::nullopt;
    }
    // Overflow still yields +/-inf, which is a legitimate value
    if (std::isnan(value)) {
        return std::nullopt;
    }
    return value;
}

Result<Dataset> DatasetLoader::from_records(const std::vector<RawRecord>& records) {
    if (records.empty()) {
        return make_error<Dataset>(ErrorCode::EMPTY_SOURCE, "Source has no header row",
                                   "DatasetLoader");
    }

    std::vector<std::string> header = records.front();
    for (size_t i = header.size(); i < kIdentityColumnCount; ++i) {
        header.push_back(kDefaultIdentityNames[i]);
    }

    std::unordered_set<std::string> seen;
    for (size_t i = kIdentityColumnCount; i < header.size(); ++i) {
        if (!seen.insert(header[i]).second) {
            WARN("Feature '" << header[i] << "' appears more than once in the header; "
                             << "lookups use the last occurrence");
        }
    }

    const size_t feature_count = header.size() - kIdentityColumnCount;
    std::vector<std::string> entity_names;
    std::vector<std::string> category_labels;
    std::vector<NumericRow> rows;
    size_t dropped = 0;

    for (size_t r = 1; r < records.size(); ++r) {
        const RawRecord& record = records[r];
        if (record.size() <= kIdentityColumnCount) {
            ++dropped;
            continue;
        }

        entity_names.push_back(record[0]);
        category_labels.push_back(record[1]);

        NumericRow row(feature_count);
        const size_t available = std::min(feature_count, record.size() - kIdentityColumnCount);
        for (size_t c = 0; c < available; ++c) {
            row[c] = parse_cell(record[ColumnIndex::to_raw_position(c)]);
        }
        rows.push_back(std::move(row));
    }

    if (dropped > 0) {
        DEBUG("Dropped " << dropped << " record(s) with " << kIdentityColumnCount
                         << " or fewer fields");
    }

    return Dataset::create(std::move(header), std::move(entity_names),
                           std::move(category_labels), std::move(rows));
}

Result<Dataset> DatasetLoader::load() const {
    CsvReader reader(config_.delimiter);
    auto records = reader.read_file(config_.file_path);
    if (records.is_error()) {
        return forward_error<Dataset>(records, "DatasetLoader");
    }

    auto dataset = from_records(records.value());
    if (dataset.is_error()) {
        return make_error<Dataset>(dataset.error()->code(),
                                   std::string(dataset.error()->what()) + ": " +
                                       config_.file_path,
                                   "DatasetLoader");
    }
    return dataset;
}

}  // namespace cross_stats
