#pragma once

#include <chrono>
#include <string>

/**
 * Everything a RosterStore needs to know about its environment. Built
 * from the configuration file by from_config(), or directly by the
 * caller.
 */
struct StoreConfig
{
  static constexpr std::chrono::seconds default_tombstone_retention{3 * 24 * 3600};
  static constexpr std::chrono::milliseconds default_busy_timeout{5000};

  /**
   * Path of the SQLite database file. Must not be empty.
   */
  std::string db_file;
  /**
   * How long a removed contact stays in the roster, so that clients
   * asking for the changes since an older version learn about it.
   */
  std::chrono::seconds tombstone_retention{default_tombstone_retention};
  /**
   * Interval between two retention sweeps. Zero means the sweep only runs
   * when the store is created, or when asked to.
   */
  std::chrono::seconds sweep_interval{0};
  /**
   * Also delete the journal rows of the contacts that are no longer in any
   * roster. The history is kept by default.
   */
  bool prune_orphaned_journal{false};
  /**
   * How long to wait for another connection to release its lock on the
   * database before failing.
   */
  std::chrono::milliseconds busy_timeout{default_busy_timeout};

  /**
   * Read the options db_name, tombstone_retention, sweep_interval,
   * prune_orphaned_journal and db_busy_timeout from the global Config. An
   * unset db_name gives default_db_file.
   */
  static StoreConfig from_config(const std::string& default_db_file="");
};
