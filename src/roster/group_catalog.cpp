#include <roster/group_catalog.hpp>

#include <database/database.hpp>
#include <database/select_query.hpp>
#include <database/insert_query.hpp>
#include <database/delete_query.hpp>
#include <database/errors.hpp>

#include <logger/logger.hpp>

namespace
{
// groupid is the only column the two tables have in common
std::string memberships()
{
  return Database::rostergroup.get_name() + " INNER JOIN " +
      Database::groupitem.get_name() + " USING (groupid)";
}
}

GroupCatalog::GroupCatalog(Database& database):
    database(database)
{
}

std::int64_t GroupCatalog::resolve_group(const std::int64_t owner_id, const std::string& name)
{
  const auto existing = this->find_group(owner_id, name);
  if (existing)
    return *existing;

  auto group = Database::rostergroup.row();
  group.col<Database::UserId>() = owner_id;
  group.col<Database::GroupName>() = name;
  if (insert(group, this->database.engine()) == StepResult::Done)
    {
      log_debug("New group ", name, " (", group.col<Database::GroupId>(), ") for user ", owner_id);
      return group.col<Database::GroupId>();
    }

  // Another connection created it between our select and our insert.
  // This can only happen outside of a write transaction: the one of a
  // roster update holds the database lock.
  const auto concurrent = this->find_group(owner_id, name);
  if (concurrent)
    return *concurrent;
  throw InconsistentState("Failed to create the group " + name + " of user " + std::to_string(owner_id));
}

std::optional<std::int64_t> GroupCatalog::find_group(const std::int64_t owner_id, const std::string& name)
{
  auto request = select(Database::rostergroup);
  request.where() << Database::UserId{} << "=" << owner_id << \
          " AND " << Database::GroupName{} << "=" << name;

  const auto result = request.execute(this->database.engine());
  if (result.empty())
    return std::nullopt;
  return result.front().col<Database::GroupId>();
}

std::vector<GroupCatalog::Group> GroupCatalog::groups_of(const std::int64_t owner_id, const std::int64_t contact_id)
{
  SelectQuery<Database::GroupId, Database::GroupName> request{memberships()};
  request.where() << Database::UserId{} << "=" << owner_id << \
          " AND " << Database::ContactId{} << "=" << contact_id;
  request.order_by() << Database::GroupName{};

  std::vector<Group> groups;
  for (const auto& row: request.execute(this->database.engine()))
    groups.emplace_back(row.col<Database::GroupId>(), row.col<Database::GroupName>());
  return groups;
}

std::map<std::int64_t, std::vector<std::string>> GroupCatalog::groups_of_owner(const std::int64_t owner_id)
{
  SelectQuery<Database::ContactId, Database::GroupName> request{memberships()};
  request.where() << Database::UserId{} << "=" << owner_id;
  request.order_by() << Database::GroupName{};

  std::map<std::int64_t, std::vector<std::string>> groups;
  for (const auto& row: request.execute(this->database.engine()))
    groups[row.col<Database::ContactId>()].push_back(row.col<Database::GroupName>());
  return groups;
}

bool GroupCatalog::add_member(const std::int64_t group_id, const std::int64_t contact_id)
{
  auto member = Database::groupitem.row();
  member.col<Database::MemberGroupId>() = group_id;
  member.col<Database::ContactId>() = contact_id;
  return insert_or_ignore(member, this->database.engine());
}

std::int64_t GroupCatalog::remove_members(const std::int64_t contact_id, const std::set<std::int64_t>& group_ids)
{
  if (group_ids.empty())
    return 0;

  DeleteQuery query(Database::groupitem.get_name());
  query.where() << Database::ContactId{} << "=" << contact_id << \
          " AND " << Database::MemberGroupId{} << " IN (";
  bool first = true;
  for (const auto& group_id: group_ids)
    {
      if (!first)
        query << ", ";
      query << group_id;
      first = false;
    }
  query << ")";
  return query.execute(this->database.engine());
}

std::vector<std::string> GroupCatalog::remove_from_all_groups(const std::int64_t owner_id, const std::int64_t contact_id)
{
  std::set<std::int64_t> group_ids;
  std::vector<std::string> names;
  for (const auto& group: this->groups_of(owner_id, contact_id))
    {
      group_ids.insert(group.first);
      names.push_back(group.second);
    }
  this->remove_members(contact_id, group_ids);
  return names;
}

std::int64_t GroupCatalog::remove_owner_groups(const std::int64_t owner_id)
{
  DeleteQuery members(Database::groupitem.get_name());
  members.where() << Database::MemberGroupId{} << " IN (SELECT " << Database::GroupId{} << \
          " FROM " << Database::rostergroup.get_name().data() << " WHERE " << Database::UserId{} << "=" << owner_id << ")";
  members.execute(this->database.engine());

  DeleteQuery groups(Database::rostergroup.get_name());
  groups.where() << Database::UserId{} << "=" << owner_id;
  return groups.execute(this->database.engine());
}
