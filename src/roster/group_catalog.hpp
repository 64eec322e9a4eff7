#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

class Database;

/**
 * The named groups of each user (rostergroup), and which contacts are in
 * them (groupitem).
 *
 * A group is created the first time a contact is put in it. It is never
 * renamed, and only deleted along with all the groups of its owner.
 */
class GroupCatalog
{
public:
  using Group = std::pair<std::int64_t, std::string>;

  explicit GroupCatalog(Database& database);
  ~GroupCatalog() = default;

  GroupCatalog(const GroupCatalog&) = delete;
  GroupCatalog(GroupCatalog&&) = delete;
  GroupCatalog& operator=(const GroupCatalog&) = delete;
  GroupCatalog& operator=(GroupCatalog&&) = delete;

  /**
   * Return the id of the owner's group with that name, creating it if
   * needed. If another connection creates it first, its id is returned.
   */
  std::int64_t resolve_group(const std::int64_t owner_id, const std::string& name);
  std::optional<std::int64_t> find_group(const std::int64_t owner_id, const std::string& name);

  /**
   * The groups of the owner that contain the contact, ordered by name.
   */
  std::vector<Group> groups_of(const std::int64_t owner_id, const std::int64_t contact_id);
  /**
   * The names of the groups of each of the owner's contacts, ordered by
   * name.
   */
  std::map<std::int64_t, std::vector<std::string>> groups_of_owner(const std::int64_t owner_id);

  /**
   * Put the contact in the group. Returns false if it already was.
   */
  bool add_member(const std::int64_t group_id, const std::int64_t contact_id);
  /**
   * Remove the contact from the given groups. Returns the number of
   * memberships that have been removed.
   */
  std::int64_t remove_members(const std::int64_t contact_id, const std::set<std::int64_t>& group_ids);
  /**
   * Remove the contact from all the groups of the owner, and return the
   * names of these groups.
   */
  std::vector<std::string> remove_from_all_groups(const std::int64_t owner_id, const std::int64_t contact_id);
  /**
   * Delete all the groups of the owner, and their memberships. Returns the
   * number of deleted groups.
   */
  std::int64_t remove_owner_groups(const std::int64_t owner_id);

private:
  Database& database;
};
