#include <roster/roster_view.hpp>
#include <roster/journal.hpp>

#include <database/select_query.hpp>
#include <database/insert_query.hpp>
#include <database/delete_query.hpp>
#include <database/errors.hpp>

#include <xmpp/subscription.hpp>
#include <logger/logger.hpp>

namespace
{
using ViewQuery = SelectQuery<Database::ContactId, Database::Jid, Database::Name,
                              Database::SubscriptionState, Database::Version>;

std::string describe_pair(const std::int64_t owner_id, const std::int64_t contact_id)
{
  return "(" + std::to_string(owner_id) + ", " + std::to_string(contact_id) + ")";
}

void execute_or_throw(Query& query, DatabaseEngine& db, const std::string& what)
{
  if (query.execute(db) != StepResult::Done)
    throw StorageFailure("Failed to " + what);
}
}

RosterView::RosterView(Database& database, Journal& journal):
    database(database),
    journal(journal)
{
}

std::vector<Database::RosterViewRow> RosterView::select(const std::int64_t owner_id)
{
  ViewQuery request{Database::roster_view};
  request.where() << Database::UserId{} << "=" << owner_id;
  request.order_by() << Database::Version{} << ", " << Database::ContactId{};
  return request.execute(this->database.engine());
}

std::vector<Database::RosterViewRow> RosterView::select_since(const std::int64_t owner_id, const std::int64_t version)
{
  ViewQuery request{Database::roster_view};
  request.where() << Database::UserId{} << "=" << owner_id << \
          " AND " << Database::Version{} << ">" << version;
  request.order_by() << Database::Version{} << ", " << Database::ContactId{};
  return request.execute(this->database.engine());
}

std::optional<Database::RosterViewRow> RosterView::select_one(const std::int64_t owner_id, const std::int64_t contact_id)
{
  ViewQuery request{Database::roster_view};
  request.where() << Database::UserId{} << "=" << owner_id << \
          " AND " << Database::ContactId{} << "=" << contact_id;
  auto result = request.execute(this->database.engine());
  if (result.empty())
    return std::nullopt;
  return std::move(result.front());
}

std::int64_t RosterView::current_version(const std::int64_t owner_id)
{
  return this->journal.version_of_owner(owner_id);
}

std::int64_t RosterView::add_item(const std::int64_t owner_id, const std::int64_t contact_id,
                                  const std::optional<std::string>& name, const std::int64_t state,
                                  const std::vector<std::string>& group_changes)
{
  const auto existing = this->stored_item(owner_id, contact_id);
  if (existing && !is_tombstone(existing->col<Database::SubscriptionState>()))
    throw InconsistentState("Roster item " + describe_pair(owner_id, contact_id) + " already exists");

  auto item = Database::rosteritem.row();
  item.col<Database::UserId>() = owner_id;
  item.col<Database::ContactId>() = contact_id;
  item.col<Database::Name>() = name;
  item.col<Database::SubscriptionState>() = state;

  // A removed item is replaced
  InsertQuery query(item.table_name, item.columns, "INSERT OR REPLACE");
  execute_or_throw(query, this->database.engine(), "save roster item " + describe_pair(owner_id, contact_id));

  return this->journal.append(owner_id, contact_id,
                              Journal::join(Journal::describe_insert(name, state), group_changes));
}

std::int64_t RosterView::update_item(const std::int64_t owner_id, const std::int64_t contact_id,
                                     const std::optional<std::string>& name, const std::int64_t state,
                                     const std::vector<std::string>& group_changes)
{
  const auto existing = this->stored_item(owner_id, contact_id);
  if (!existing)
    throw InconsistentState("Roster item " + describe_pair(owner_id, contact_id) + " does not exist");
  const auto previous_state = existing->col<Database::SubscriptionState>();
  if (is_tombstone(previous_state))
    throw InconsistentState("Roster item " + describe_pair(owner_id, contact_id) + " has been removed");

  Query query{"UPDATE " + Database::rosteritem.get_name() + " SET "};
  query << Database::Name{} << "=" << name << ", " << Database::SubscriptionState{} << "=" << state << \
          " WHERE " << Database::UserId{} << "=" << owner_id << " AND " << Database::ContactId{} << "=" << contact_id;
  execute_or_throw(query, this->database.engine(), "update roster item " + describe_pair(owner_id, contact_id));

  return this->journal.append(owner_id, contact_id,
                              Journal::join(Journal::describe_update(existing->col<Database::Name>(), previous_state),
                                            group_changes));
}

RosterView::RemoveResult RosterView::remove_item(const std::int64_t owner_id, const std::int64_t contact_id,
                                                 const std::vector<std::string>& group_changes)
{
  const auto existing = this->stored_item(owner_id, contact_id);
  if (!existing)
    return RemoveResult::Absent;

  const auto previous_state = existing->col<Database::SubscriptionState>();
  if (is_tombstone(previous_state))
    {
      DeleteQuery query(Database::rosteritem.get_name());
      query.where() << Database::UserId{} << "=" << owner_id << \
              " AND " << Database::ContactId{} << "=" << contact_id;
      query.execute(this->database.engine());
      log_debug("Purged roster item ", describe_pair(owner_id, contact_id));
      return RemoveResult::Purged;
    }

  Query query{"UPDATE " + Database::rosteritem.get_name() + " SET "};
  query << Database::SubscriptionState{} << "=" << (previous_state | Subscription::tombstone_bit) << \
          " WHERE " << Database::UserId{} << "=" << owner_id << " AND " << Database::ContactId{} << "=" << contact_id;
  execute_or_throw(query, this->database.engine(), "remove roster item " + describe_pair(owner_id, contact_id));

  this->journal.append(owner_id, contact_id,
                       Journal::join(Journal::describe_delete(existing->col<Database::Name>(), previous_state),
                                     group_changes));
  return RemoveResult::Tombstoned;
}

std::int64_t RosterView::group_change(const std::int64_t owner_id, const std::int64_t contact_id,
                                      const std::vector<std::string>& group_changes)
{
  return this->journal.append(owner_id, contact_id, Journal::join({}, group_changes));
}

std::optional<Database::RosterItemRow> RosterView::stored_item(const std::int64_t owner_id, const std::int64_t contact_id)
{
  auto request = ::select(Database::rosteritem);
  request.where() << Database::UserId{} << "=" << owner_id << \
          " AND " << Database::ContactId{} << "=" << contact_id;
  auto result = request.execute(this->database.engine());
  if (result.empty())
    return std::nullopt;
  return std::move(result.front());
}
