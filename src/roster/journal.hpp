#pragma once

#include <database/database.hpp>

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

/**
 * The append-only log of every change made to a roster item, or to its
 * groups.
 *
 * Each entry gets a number greater than all the previous ones, across all
 * users, and never reused. The number of the last entry about a contact is
 * the version of that roster item.
 */
class Journal
{
public:
  explicit Journal(Database& database);
  ~Journal() = default;

  Journal(const Journal&) = delete;
  Journal(Journal&&) = delete;
  Journal& operator=(const Journal&) = delete;
  Journal& operator=(Journal&&) = delete;

  /**
   * Record the operation and return the number of the new entry.
   */
  std::int64_t append(const std::int64_t owner_id, const std::int64_t contact_id,
                      const std::string& operation,
                      const std::chrono::system_clock::time_point& when=std::chrono::system_clock::now());
  /**
   * Number of the last entry about this contact, 0 if there is none.
   */
  std::int64_t version_of(const std::int64_t owner_id, const std::int64_t contact_id);
  /**
   * Number of the last entry about any contact of the owner, 0 if there is
   * none.
   */
  std::int64_t version_of_owner(const std::int64_t owner_id);
  /**
   * Number of the last entry, for any user.
   */
  std::int64_t high_water_mark();
  std::vector<Database::JournalEntry> history(const std::int64_t owner_id, const std::int64_t contact_id);
  /**
   * Delete the entries about contacts that are no longer in the owner's
   * roster. Returns the number of deleted entries.
   */
  std::int64_t prune_orphans();

  static std::string describe_insert(const std::optional<std::string>& name, const std::int64_t state);
  static std::string describe_update(const std::optional<std::string>& previous_name, const std::int64_t previous_state);
  static std::string describe_delete(const std::optional<std::string>& previous_name, const std::int64_t previous_state);
  static std::string describe_group_addition(const std::string& group);
  static std::string describe_group_removal(const std::string& group);
  /**
   * Join the description of an item change with the descriptions of the
   * group changes that came with it.
   */
  static std::string join(const std::string& head, const std::vector<std::string>& notes);

private:
  Database& database;
};
