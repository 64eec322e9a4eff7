#include <utils/time.hpp>
#include <time.h>

namespace utils
{
std::string to_sql_timestamp(const std::time_t& timestamp)
{
  constexpr std::size_t stamp_size = 20;
  char date_buf[stamp_size];
  std::tm t{};
  if (::gmtime_r(&timestamp, &t) == nullptr)
    return "";
  if (std::strftime(date_buf, stamp_size, "%F %T", &t) != stamp_size - 1)
    return "";
  return {std::begin(date_buf), std::end(date_buf) - 1};
}

std::string to_sql_timestamp(const std::chrono::system_clock::time_point& time_point)
{
  return to_sql_timestamp(std::chrono::system_clock::to_time_t(time_point));
}
}
