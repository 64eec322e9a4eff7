/**
 * Read the config file and save all the values in a map.
 * Also, a singleton.
 *
 * Use Config::read_conf("bla") to set the filename you want to use and
 * read it. Config::get() can then be used to access the values in the conf.
 *
 * The file contains one option=value per line. Lines starting with # are
 * comments, spaces around the option name and the value are ignored.
 *
 * Every option can also be given through the environment, with the
 * ROSTERSTORE_ prefix: ROSTERSTORE_DB_NAME=/tmp/roster.sqlite sets the
 * db_name option. The environment takes precedence over the file.
 */

#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>

class Config
{
public:
  Config() = delete;
  ~Config() = delete;
  Config(const Config&) = delete;
  Config& operator=(const Config&) = delete;
  Config(Config&&) = delete;
  Config& operator=(Config&&) = delete;

  /**
   * returns a value from the config. If it doesn’t exist, use
   * the second argument as the default.
   */
  static std::string get(const std::string&, const std::string&);
  /**
   * true, yes, on and 1 are true; false, no, off and 0 are false. The
   * default is returned for anything else.
   */
  static bool get_bool(const std::string&, const bool);
  /**
   * The value, if it is set and is entirely an integer.
   */
  static std::optional<std::int64_t> get_int(const std::string&);
  static std::int64_t get_int(const std::string&, const std::int64_t);
  static void set(const std::string&, const std::string&);
  /**
   * Remove all the values read so far.
   */
  static void clear();
  /**
   * Read the configuration file at the given path, or the last one read if
   * empty. Returns false if it cannot be opened.
   */
  static bool read_conf(const std::string& name="");
  static const std::string& get_filename()
  { return Config::filename; }

private:
  static void parse_line(const std::string& line, const bool env);

  static std::string filename;
  static std::map<std::string, std::string> values;
};
