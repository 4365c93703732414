// src/core/config_base.cpp

#include "cross_stats/core/config_base.hpp"
#include <iomanip>

namespace cross_stats {

Result<void> ConfigBase::save_to_file(const std::string& filepath) const {
    std::ofstream file(filepath);
    if (!file.is_open()) {
        return make_error<void>(ErrorCode::FILE_IO_ERROR,
                                "Failed to open file for writing: " + filepath, "ConfigBase");
    }
    file << std::setw(4) << to_json() << std::endl;
    if (!file.good()) {
        return make_error<void>(ErrorCode::FILE_IO_ERROR, "Failed while writing: " + filepath,
                                "ConfigBase");
    }
    return Result<void>();
}

Result<void> ConfigBase::load_from_file(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        return make_error<void>(ErrorCode::FILE_NOT_FOUND,
                                "Failed to open file for reading: " + filepath, "ConfigBase");
    }

    try {
        nlohmann::json j;
        file >> j;
        from_json(j);
    } catch (const nlohmann::json::exception& e) {
        return make_error<void>(ErrorCode::JSON_PARSE_ERROR,
                                std::string("Error loading config: ") + e.what(), "ConfigBase");
    }
    return Result<void>();
}

}  // namespace cross_stats
