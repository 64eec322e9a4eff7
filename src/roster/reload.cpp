#include <roster/reload.hpp>

#include <database/errors.hpp>
#include <config/config.hpp>
#include <logger/logger.hpp>
#include <utils/xdg.hpp>

std::unique_ptr<RosterStore> open_store()
{
  const auto config = StoreConfig::from_config(xdg_data_path("roster.sqlite"));
  log_info("Opening database: ", config.db_file);
  auto store = std::make_unique<RosterStore>(config);
  log_info("Database successfully opened.");
  return store;
}

void reload_process(std::unique_ptr<RosterStore>& store)
{
  Config::read_conf();
  // Destroy the logger instance, to be recreated the next time a log
  // line needs to be written
  Logger::reset();
  log_info("Configuration and logger reloaded.");
  try
    {
      auto new_store = open_store();
      store = std::move(new_store);
    }
  catch (const StoreError& error)
    {
      log_warning("Failed to reopen the database (", error.what(), "), re-using the previous one.");
    }
}
