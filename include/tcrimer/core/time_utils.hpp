#pragma once

#include <time.h>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <optional>
#include <sstream>
#include <string>

namespace tcrimer {
namespace core {

/**
 * @brief Thread-safe wrapper for localtime
 *
 * @param time Pointer to time_t value
 * @param result Pointer to tm struct where result will be stored
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
 * @brief Format a time point in UTC with a strftime format
 */
inline std::string format_utc(const std::chrono::system_clock::time_point& tp,
                              const char* format = "%Y-%m-%d %H:%M:%S") {
    auto tt = std::chrono::system_clock::to_time_t(tp);
    std::tm result{};
    safe_gmtime(&tt, &result);

    char buffer[128];
    std::strftime(buffer, sizeof(buffer), format, &result);
    return std::string(buffer);
}

/**
 * @brief Parse "YYYY-MM-DD" or "YYYY-MM-DD HH:MM:SS" (also with a 'T'
 * separator) as UTC
 */
inline std::optional<std::chrono::system_clock::time_point> parse_utc(std::string text) {
    for (auto& c : text) {
        if (c == 'T')
            c = ' ';
    }

    std::tm tm{};
    std::istringstream ss(text);
    if (text.size() > 10) {
        ss >> std::get_time(&tm, "%Y-%m-%d %H:%M:%S");
    } else {
        ss >> std::get_time(&tm, "%Y-%m-%d");
    }
    if (ss.fail()) {
        return std::nullopt;
    }

#ifdef _WIN32
    std::time_t tt = _mkgmtime(&tm);
#else
    std::time_t tt = timegm(&tm);
#endif
    return std::chrono::system_clock::from_time_t(tt);
}

/**
 * @brief Get current time as a string with specified format
 */
inline std::string get_formatted_time(const char* format, bool use_local_time = true) {
    auto now = std::chrono::system_clock::now();
    auto now_c = std::chrono::system_clock::to_time_t(now);
    std::tm result{};

    if (use_local_time) {
        safe_localtime(&now_c, &result);
    } else {
        safe_gmtime(&now_c, &result);
    }

    char buffer[128];
    std::strftime(buffer, sizeof(buffer), format, &result);
    return std::string(buffer);
}

}  // namespace core
}  // namespace tcrimer
