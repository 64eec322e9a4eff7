#include <logger/logger.hpp>
#include <config/config.hpp>
#include <utils/tolower.hpp>

#include <algorithm>
#include <cstdlib>
#include <vector>

#include <sys/types.h>
#include <sys/stat.h>
#include <unistd.h>

namespace
{
const std::vector<std::string> level_names{"debug", "info", "warning", "error"};
const char* level_headers[] = {"[DEBUG]: ", "[INFO]: ", "[WARNING]: ", "[ERROR]: "};
}

Logger::Logger(const int log_level):
  log_level(log_level),
  stream(std::cout.rdbuf())
{
#ifdef SYSTEMD_FOUND
  // See https://www.freedesktop.org/software/systemd/man/systemd.exec.html#%24JOURNAL_STREAM
  const char* journal_stream = ::getenv("JOURNAL_STREAM");
  if (journal_stream == nullptr)
    return;

  struct stat s{};
  if (::fstat(STDOUT_FILENO, &s) == -1)
    return;

  const auto stdout_stream = std::to_string(s.st_dev) + ":" + std::to_string(s.st_ino);
  this->use_systemd = stdout_stream == journal_stream;
#endif
}

Logger::Logger(const int log_level, const std::string& log_file):
  log_level(log_level),
  ofstream(log_file.data(), std::ios_base::app),
  stream(ofstream.rdbuf())
{
  if (!this->ofstream.is_open())
    {
      std::cerr << "Could not open the log file " << log_file << ", logging to stdout instead" << std::endl;
      this->stream.rdbuf(std::cout.rdbuf());
    }
}

std::unique_ptr<Logger>& Logger::instance()
{
  static std::unique_ptr<Logger> instance;

  if (!instance)
    {
      const std::string log_file = Config::get("log_file", "");
      const int log_level = Logger::parse_level(Config::get("log_level", "0"));
      if (log_file.empty())
        instance = std::make_unique<Logger>(log_level);
      else
        instance = std::make_unique<Logger>(log_level, log_file);
    }
  return instance;
}

void Logger::reset()
{
  std::lock_guard<std::mutex> lock(Logger::mutex());
  Logger::instance().reset();
}

std::mutex& Logger::mutex()
{
  static std::mutex mutex;
  return mutex;
}

int Logger::parse_level(const std::string& value)
{
  const auto it = std::find(level_names.begin(), level_names.end(), utils::tolower(value));
  if (it != level_names.end())
    return static_cast<int>(it - level_names.begin());
  return std::atoi(value.data());
}

void Logger::write(const int level, const int syslog_level, const char* src_file, const int line,
                   const std::string& message)
{
#ifdef SYSTEMD_FOUND
  if (this->use_systemd)
    {
      sd_journal_send("MESSAGE=%s", message.data(),
                      "PRIORITY=%i", syslog_level,
                      "CODE_FILE=%s", src_file,
                      "CODE_LINE=%i", line,
                      nullptr);
      return;
    }
#endif
  (void)syslog_level;
  this->stream << level_headers[std::clamp(level, debug_lvl, error_lvl)] << src_file << ':' << line << ":\t"
               << message << std::endl;
}
