#pragma once

/**
 * Singleton used by the logging macros to write into a file, stdout or the
 * systemd journal, with various levels of severity.
 *
 * Only the macros should be used. They can be called from any thread: each
 * line is formatted first, and then written at once.
 * @class Logger
 */

#include <memory>
#include <mutex>
#include <string>
#include <iostream>
#include <fstream>
#include <sstream>

#define debug_lvl 0
#define info_lvl 1
#define warning_lvl 2
#define error_lvl 3

#include "rosterstore.h"
#ifdef SYSTEMD_FOUND
#define SD_JOURNAL_SUPPRESS_LOCATION
# include <systemd/sd-daemon.h>
# include <systemd/sd-journal.h>
#else
# define LOG_ERR 3
# define LOG_WARNING 4
# define LOG_INFO 6
# define LOG_DEBUG 7
#endif

// Macro defined to get the filename instead of the full path. But if it is
// not properly defined by the build system, we fallback to __FILE__
#ifndef __FILENAME__
# define __FILENAME__ __FILE__
#endif

class Logger
{
public:
  /**
   * The instance is created from the log_level and log_file options the
   * first time it is used.
   */
  static std::unique_ptr<Logger>& instance();
  /**
   * Destroy the instance, it will be created again (with the current
   * configuration) the next time a line is logged.
   */
  static void reset();
  static std::mutex& mutex();
  /**
   * The value of the log_level option is a number from 0 (debug) to 3
   * (error), or the name of the level.
   */
  static int parse_level(const std::string& value);

  explicit Logger(const int log_level);
  /**
   * Append to the given file. If it cannot be opened, stdout is used
   * instead.
   */
  Logger(const int log_level, const std::string& log_file);

  Logger(const Logger&) = delete;
  Logger& operator=(const Logger&) = delete;
  Logger(Logger&&) = delete;
  Logger& operator=(Logger&&) = delete;

  bool accepts(const int level) const
  {
    return level >= this->log_level;
  }
  void write(const int level, const int syslog_level, const char* src_file, const int line,
             const std::string& message);

private:
  const int log_level;
  std::ofstream ofstream{};
  std::ostream stream;
#ifdef SYSTEMD_FOUND
  /**
   * stdout is connected to the journal: send it the structured entries
   * instead.
   */
  bool use_systemd{false};
#endif
};

namespace logging_details
{
  template <typename T>
  void write_all(std::ostream& os, const T& arg)
  {
    os << arg;
  }

  template <typename T, typename... U>
  void write_all(std::ostream& os, const T& first, U&&... rest)
  {
    os << first;
    write_all(os, std::forward<U>(rest)...);
  }

  template <typename... U>
  void do_logging(const int level, const int syslog_level, const char* src_file, const int line, U&&... args)
  {
    std::ostringstream os;
    write_all(os, std::forward<U>(args)...);

    std::lock_guard<std::mutex> lock(Logger::mutex());
    const auto& logger = Logger::instance();
    if (logger->accepts(level))
      logger->write(level, syslog_level, src_file, line, os.str());
  }
}

#define log_debug(...) logging_details::do_logging(debug_lvl, LOG_DEBUG, __FILENAME__, __LINE__, __VA_ARGS__)

#define log_info(...) logging_details::do_logging(info_lvl, LOG_INFO, __FILENAME__, __LINE__, __VA_ARGS__)

#define log_warning(...) logging_details::do_logging(warning_lvl, LOG_WARNING, __FILENAME__, __LINE__, __VA_ARGS__)

#define log_error(...) logging_details::do_logging(error_lvl, LOG_ERR, __FILENAME__, __LINE__, __VA_ARGS__)
