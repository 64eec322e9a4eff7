#pragma once

#include <chrono>
#include <cstdint>

class Database;
class Journal;

/**
 * Delete for good the roster items that have been marked as removed for
 * longer than the retention period. Until then, a client asking for the
 * changes since an older version is told about the removal.
 */
class RetentionSweeper
{
public:
  static constexpr auto event_name = "roster tombstone sweep";

  RetentionSweeper(Database& database, Journal& journal,
                   const std::chrono::seconds& retention, const bool prune_orphaned_journal);
  ~RetentionSweeper() = default;

  RetentionSweeper(const RetentionSweeper&) = delete;
  RetentionSweeper(RetentionSweeper&&) = delete;
  RetentionSweeper& operator=(const RetentionSweeper&) = delete;
  RetentionSweeper& operator=(RetentionSweeper&&) = delete;

  /**
   * Purge the items removed before now - retention, in a single
   * transaction. Returns the number of purged items. Throws on error.
   */
  std::int64_t run(const std::chrono::system_clock::time_point& now);
  /**
   * Same as run(), but errors are only logged, and 0 is returned.
   */
  std::int64_t run_safely(const std::chrono::system_clock::time_point& now);

private:
  Database& database;
  Journal& journal;
  const std::chrono::seconds retention;
  const bool prune_orphaned_journal;
};
