#pragma once

#include <ctime>
#include <string>
#include <chrono>

namespace utils
{
/**
 * Format the timestamp the way sqlite writes CURRENT_TIMESTAMP:
 * "YYYY-MM-DD HH:MM:SS", in UTC. These strings sort chronologically.
 */
std::string to_sql_timestamp(const std::time_t& timestamp);
std::string to_sql_timestamp(const std::chrono::system_clock::time_point& time_point);
}
