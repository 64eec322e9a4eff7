#include <roster/journal.hpp>

#include <database/select_query.hpp>
#include <database/insert_query.hpp>
#include <database/delete_query.hpp>
#include <database/count_query.hpp>
#include <database/errors.hpp>

#include <utils/time.hpp>
#include <logger/logger.hpp>

namespace
{
std::string name_or_null(const std::optional<std::string>& name)
{
  return name ? *name : "<NULL>";
}
}

Journal::Journal(Database& database):
    database(database)
{
}

std::int64_t Journal::append(const std::int64_t owner_id, const std::int64_t contact_id,
                             const std::string& operation,
                             const std::chrono::system_clock::time_point& when)
{
  auto entry = Database::journal.row();
  entry.col<Database::UserId>() = owner_id;
  entry.col<Database::ContactId>() = contact_id;
  entry.col<Database::Timestamp>() = utils::to_sql_timestamp(when);
  entry.col<Database::Operation>() = operation;

  if (insert(entry, this->database.engine()) != StepResult::Done)
    throw StorageFailure("Failed to append \"" + operation + "\" to the journal");
  log_debug("Journal entry ", entry.col<Database::Entry>(), " (", owner_id, ", ", contact_id, "): ", operation);
  return entry.col<Database::Entry>();
}

std::int64_t Journal::version_of(const std::int64_t owner_id, const std::int64_t contact_id)
{
  ScalarQuery query{"SELECT max(entry) FROM journal WHERE "};
  query << Database::UserId{} << "=" << owner_id << " AND " << Database::ContactId{} << "=" << contact_id;
  return query.execute(this->database.engine()).value_or(0);
}

std::int64_t Journal::version_of_owner(const std::int64_t owner_id)
{
  ScalarQuery query{"SELECT max(entry) FROM journal WHERE "};
  query << Database::UserId{} << "=" << owner_id;
  return query.execute(this->database.engine()).value_or(0);
}

std::int64_t Journal::high_water_mark()
{
  ScalarQuery query{"SELECT max(entry) FROM journal"};
  return query.execute(this->database.engine()).value_or(0);
}

std::vector<Database::JournalEntry> Journal::history(const std::int64_t owner_id, const std::int64_t contact_id)
{
  auto request = select(Database::journal);
  request.where() << Database::UserId{} << "=" << owner_id << \
          " AND " << Database::ContactId{} << "=" << contact_id;
  request.order_by() << Database::Entry{};
  return request.execute(this->database.engine());
}

std::int64_t Journal::prune_orphans()
{
  DeleteQuery query(Database::journal.get_name());
  query.where() << "NOT EXISTS (SELECT 1 FROM rosteritem r"
          " WHERE r.userid=journal.userid AND r.contactid=journal.contactid)";
  const auto pruned = query.execute(this->database.engine());
  if (pruned > 0)
    log_info("Pruned ", pruned, " journal entries of removed contacts");
  return pruned;
}

std::string Journal::describe_insert(const std::optional<std::string>& name, const std::int64_t state)
{
  return "INSERT " + name_or_null(name) + ", " + std::to_string(state);
}

std::string Journal::describe_update(const std::optional<std::string>& previous_name, const std::int64_t previous_state)
{
  return "UPDATE " + name_or_null(previous_name) + " " + std::to_string(previous_state);
}

std::string Journal::describe_delete(const std::optional<std::string>& previous_name, const std::int64_t previous_state)
{
  return "DELETE " + name_or_null(previous_name) + " " + std::to_string(previous_state);
}

std::string Journal::describe_group_addition(const std::string& group)
{
  return "GRPADD " + group;
}

std::string Journal::describe_group_removal(const std::string& group)
{
  return "GRPDEL " + group;
}

std::string Journal::join(const std::string& head, const std::vector<std::string>& notes)
{
  std::string res = head;
  for (const auto& note: notes)
    {
      if (!res.empty())
        res += "; ";
      res += note;
    }
  return res;
}
