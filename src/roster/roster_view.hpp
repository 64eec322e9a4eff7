#pragma once

#include <database/database.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

class Journal;

/**
 * Read the roster items of a user along with their version, and write
 * them. Each write changes the rosteritem table and appends exactly one
 * entry to the journal, in the caller's transaction.
 */
class RosterView
{
public:
  enum class RemoveResult
  {
    /** There was no such item */
    Absent,
    /** The item has been marked as removed, and journaled */
    Tombstoned,
    /** The item was already marked as removed, it is now deleted */
    Purged,
  };

  RosterView(Database& database, Journal& journal);
  ~RosterView() = default;

  RosterView(const RosterView&) = delete;
  RosterView(RosterView&&) = delete;
  RosterView& operator=(const RosterView&) = delete;
  RosterView& operator=(RosterView&&) = delete;

  /**
   * All the items of the owner, removed ones included, ordered by version
   * and then by contact id.
   */
  std::vector<Database::RosterViewRow> select(const std::int64_t owner_id);
  /**
   * Same as select(), but only the items with a version greater than the
   * given one.
   */
  std::vector<Database::RosterViewRow> select_since(const std::int64_t owner_id, const std::int64_t version);
  std::optional<Database::RosterViewRow> select_one(const std::int64_t owner_id, const std::int64_t contact_id);
  /**
   * The version of the owner's roster as a whole: the number of the last
   * journal entry concerning one of its contacts.
   */
  std::int64_t current_version(const std::int64_t owner_id);

  /**
   * Insert a new item, or replace one that has been removed. Returns the
   * new version of the item.
   */
  std::int64_t add_item(const std::int64_t owner_id, const std::int64_t contact_id,
                        const std::optional<std::string>& name, const std::int64_t state,
                        const std::vector<std::string>& group_changes={});
  /**
   * Change the name and subscription state of an item that exists and is
   * not removed. Returns the new version of the item.
   */
  std::int64_t update_item(const std::int64_t owner_id, const std::int64_t contact_id,
                           const std::optional<std::string>& name, const std::int64_t state,
                           const std::vector<std::string>& group_changes={});
  /**
   * Mark the item as removed. If it already was, delete it for good,
   * without any journal entry.
   */
  RemoveResult remove_item(const std::int64_t owner_id, const std::int64_t contact_id,
                           const std::vector<std::string>& group_changes={});
  /**
   * Journal group changes that came without any change of the item
   * itself. Returns the new version of the item.
   */
  std::int64_t group_change(const std::int64_t owner_id, const std::int64_t contact_id,
                            const std::vector<std::string>& group_changes);

private:
  std::optional<Database::RosterItemRow> stored_item(const std::int64_t owner_id, const std::int64_t contact_id);

  Database& database;
  Journal& journal;
};
