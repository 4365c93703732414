// include/cross_stats/core/time_utils.hpp

#pragma once

#include <time.h>
#include <chrono>
#include <ctime>
#include <string>

namespace cross_stats {
namespace core {

/**
 * @brief Thread-safe wrapper for localtime
 * @return Pointer to the result tm struct on success, nullptr on failure
 */
inline std::tm* safe_localtime(const std::time_t* time, std::tm* result) {
#ifdef _WIN32
    if (localtime_s(result, time) != 0) {
        return nullptr;
    }
    return result;
#else
    return localtime_r(time, result);
#endif
}

/**
 * @brief Format the current local time with a strftime pattern
 */
inline std::string get_formatted_time(const char* format) {
    auto now_c = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm result{};
    safe_localtime(&now_c, &result);

    char buffer[64];
    std::strftime(buffer, sizeof(buffer), format, &result);
    return std::string(buffer);
}

}  // namespace core
}  // namespace cross_stats
