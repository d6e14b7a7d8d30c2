#pragma once

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <string>

namespace ferry::util {

inline std::string timestampToString(const std::time_t ts) {
    std::ostringstream oss;
    oss << std::put_time(std::gmtime(&ts), "%Y-%m-%dT%H:%M:%SZ"); // ISO 8601 UTC
    return oss.str();
}

inline std::string timestampToString(const std::chrono::system_clock::time_point tp) {
    return timestampToString(std::chrono::system_clock::to_time_t(tp));
}

// Returns the epoch on malformed input so callers treat the record as expired.
inline std::chrono::system_clock::time_point parseTimestamp(const std::string& iso) {
    std::tm tm = {};
    std::istringstream ss(iso);
    ss >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    if (ss.fail()) return std::chrono::system_clock::time_point{};
    return std::chrono::system_clock::from_time_t(timegm(&tm));
}

inline std::string getCurrentTimestamp() {
    return timestampToString(std::chrono::system_clock::now());
}

} // namespace ferry::util
