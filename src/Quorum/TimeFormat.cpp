// =================================================================
// src/Quorum/TimeFormat.cpp
// =================================================================

#include "Quorum/TimeFormat.hpp"
#include <ctime>
#include <iomanip>
#include <sstream>

namespace Quorum {

std::string formatUtc(const std::chrono::system_clock::time_point& time_point, const char* pattern) {
    auto time_t = std::chrono::system_clock::to_time_t(time_point);
    std::tm utc_tm{};
    gmtime_r(&time_t, &utc_tm);

    std::ostringstream oss;
    oss << std::put_time(&utc_tm, pattern);
    return oss.str();
}

std::string formatIsoTimestamp(const std::chrono::system_clock::time_point& time_point) {
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        time_point.time_since_epoch()) % 1000;

    std::ostringstream oss;
    oss << formatUtc(time_point, "%Y-%m-%dT%H:%M:%S");
    oss << "." << std::setfill('0') << std::setw(3) << ms.count() << "Z";
    return oss.str();
}

} // namespace Quorum
