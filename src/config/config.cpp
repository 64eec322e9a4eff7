#include <config/config.hpp>
#include <utils/tolower.hpp>

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <iostream>

using namespace std::string_literals;

extern char** environ;

std::string Config::filename{};
std::map<std::string, std::string> Config::values{};

namespace
{
std::string trim(const std::string& str)
{
  const auto first = str.find_first_not_of(" \t\r");
  if (first == std::string::npos)
    return {};
  const auto last = str.find_last_not_of(" \t\r");
  return str.substr(first, last - first + 1);
}
}

std::string Config::get(const std::string& option, const std::string& def)
{
  auto it = Config::values.find(option);

  if (it == Config::values.end())
    return def;
  return it->second;
}

bool Config::get_bool(const std::string& option, const bool def)
{
  const auto res = utils::tolower(Config::get(option, ""));
  if (res == "true" || res == "yes" || res == "on" || res == "1")
    return true;
  if (res == "false" || res == "no" || res == "off" || res == "0")
    return false;
  return def;
}

std::optional<std::int64_t> Config::get_int(const std::string& option)
{
  const std::string res = Config::get(option, "");
  if (res.empty())
    return std::nullopt;
  char* end = nullptr;
  errno = 0;
  const auto value = std::strtoll(res.data(), &end, 10);
  if (errno != 0 || *end != '\0')
    return std::nullopt;
  return value;
}

std::int64_t Config::get_int(const std::string& option, const std::int64_t def)
{
  return Config::get_int(option).value_or(def);
}

void Config::set(const std::string& option, const std::string& value)
{
  Config::values[option] = value;
}

void Config::clear()
{
  Config::values.clear();
}

void Config::parse_line(const std::string& line, const bool env)
{
  static const auto env_option_prefix = "ROSTERSTORE_"s;

  if (line.empty() || line[0] == '#')
    return;
  const auto pos = line.find('=');
  if (pos == std::string::npos)
    return;
  std::string option = trim(line.substr(0, pos));
  std::string value = trim(line.substr(pos + 1));
  if (env)
    {
      if (option.compare(0, env_option_prefix.size(), env_option_prefix) != 0)
        return;
      option = utils::tolower(option.substr(env_option_prefix.size()));
    }
  if (!option.empty())
    Config::values[option] = value;
}

bool Config::read_conf(const std::string& name)
{
  if (!name.empty())
    Config::filename = name;

  std::ifstream file(Config::filename.data());
  if (!file.is_open())
    {
      std::cerr << "Error while opening file " << filename << " for reading: " << strerror(errno) << std::endl;
      return false;
    }

  Config::clear();

  std::string line;
  while (std::getline(file, line))
    Config::parse_line(line, false);

  for (char** env_line = environ; *env_line; ++env_line)
    Config::parse_line(*env_line, true);
  return true;
}
