#include <roster/store_config.hpp>

#include <config/config.hpp>
#include <logger/logger.hpp>

namespace
{
template <typename Duration>
Duration read_duration(const std::string& option, const Duration& default_value)
{
  if (Config::get(option, "").empty())
    return default_value;
  const auto value = Config::get_int(option);
  if (!value || *value < 0)
    {
      log_warning("Invalid value for ", option, ": \"", Config::get(option, ""), "\", using ",
                  default_value.count(), " instead");
      return default_value;
    }
  return Duration{*value};
}
}

StoreConfig StoreConfig::from_config(const std::string& default_db_file)
{
  StoreConfig config;
  config.db_file = Config::get("db_name", default_db_file);
  config.tombstone_retention = read_duration("tombstone_retention", StoreConfig::default_tombstone_retention);
  config.sweep_interval = read_duration("sweep_interval", std::chrono::seconds{0});
  config.prune_orphaned_journal = Config::get_bool("prune_orphaned_journal", false);
  config.busy_timeout = read_duration("db_busy_timeout", StoreConfig::default_busy_timeout);
  return config;
}
