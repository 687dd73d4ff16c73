// =================================================================
// include/Quorum/TimeFormat.hpp
// =================================================================
// Timestamp formatting shared by reports and records.

#pragma once

#include <chrono>
#include <string>

namespace Quorum {

/**
 * @brief Format a time point as ISO 8601 UTC with milliseconds
 * @param time_point Time to format
 * @return String such as "2024-05-01T09:30:00.250Z"
 */
std::string formatIsoTimestamp(const std::chrono::system_clock::time_point& time_point);

/**
 * @brief Format a time point in UTC with a strftime pattern
 * @param time_point Time to format
 * @param pattern strftime pattern, e.g. "%Y%m%d"
 * @return Formatted string
 */
std::string formatUtc(const std::chrono::system_clock::time_point& time_point, const char* pattern);

} // namespace Quorum
