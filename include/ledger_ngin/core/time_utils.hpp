// include/ledger_ngin/core/time_utils.hpp
#pragma once

#include <time.h>
#include <chrono>
#include <ctime>
#include <string>
#include "ledger_ngin/core/types.hpp"

namespace ledger_ngin {
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
 * @brief Thread-safe wrapper for gmtime
 * @return Pointer to the result tm struct on success, nullptr on failure
 */
inline std::tm* safe_gmtime(const std::time_t* time, std::tm* result) {
#ifdef _WIN32
    if (gmtime_s(result, time) != 0) {
        return nullptr;
    }
    return result;
#else
    return gmtime_r(time, result);
#endif
}

/**
 * @brief Format a timestamp with a strftime pattern
 * @param ts Timestamp to format
 * @param format Format string compatible with strftime
 * @param use_local_time If true, uses local time, otherwise UTC
 */
inline std::string format_timestamp(const Timestamp& ts, const char* format,
                                    bool use_local_time = false) {
    auto time_c = std::chrono::system_clock::to_time_t(ts);
    std::tm result{};
    if (use_local_time) {
        safe_localtime(&time_c, &result);
    } else {
        safe_gmtime(&time_c, &result);
    }

    char buffer[128];
    std::strftime(buffer, sizeof(buffer), format, &result);
    return std::string(buffer);
}

/**
 * @brief Get current time as a string with specified format
 */
inline std::string get_formatted_time(const char* format, bool use_local_time = true) {
    return format_timestamp(std::chrono::system_clock::now(), format, use_local_time);
}

}  // namespace core
}  // namespace ledger_ngin
