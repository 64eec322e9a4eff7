#include <roster/roster_store.hpp>

#include <database/errors.hpp>

#include <utils/timed_events.hpp>
#include <logger/logger.hpp>

#include <algorithm>
#include <set>

namespace
{
StoreConfig check_configured(StoreConfig config)
{
  if (config.db_file.empty())
    {
      log_error("No database file configured for the roster store");
      throw NotConfigured("No database file configured for the roster store");
    }
  return config;
}

/**
 * The group names, in the same order, without duplicates
 */
std::vector<std::string> unique_groups(const std::vector<std::string>& groups)
{
  std::vector<std::string> res;
  for (const auto& group: groups)
    if (std::find(res.begin(), res.end(), group) == res.end())
      res.push_back(group);
  return res;
}
}

RosterStore::RosterStore(StoreConfig config):
    config(check_configured(std::move(config))),
    database(this->config.db_file, static_cast<int>(this->config.busy_timeout.count())),
    interner(this->database),
    groups(this->database),
    journal(this->database),
    view(this->database, this->journal),
    sweeper(this->database, this->journal,
            this->config.tombstone_retention, this->config.prune_orphaned_journal)
{
  this->sweeper.run_safely(std::chrono::system_clock::now());
}

RosterStore::~RosterStore()
{
  if (this->sweep_events && this->sweep_owner.use_count() > 1)
    this->sweep_events->cancel(RetentionSweeper::event_name);
}

template <typename Callable>
auto RosterStore::run(const std::string& context, Callable&& operation)
{
  std::lock_guard<std::mutex> lock(this->mutex);
  try
    {
      return operation();
    }
  catch (const StorageFailure& error)
    {
      log_error("Failed ", context, ": ", error.what());
      throw StorageFailure(context + ": " + error.what());
    }
  catch (const InconsistentState& error)
    {
      log_error("Failed ", context, ": ", error.what());
      throw InconsistentState(context + ": " + error.what());
    }
  catch (const IdentityResolutionFailure& error)
    {
      log_error("Failed ", context, ": ", error.what());
      throw IdentityResolutionFailure(context + ": " + error.what());
    }
}

Roster RosterStore::load(const std::string& owner)
{
  return this->run("loading the roster of " + owner, [&]()
  {
    const auto owner_id = this->interner.find(owner);
    if (!owner_id)
      return Roster{};

    Transaction transaction(this->database);
    auto roster = this->make_roster(*owner_id, this->view.select(*owner_id));
    transaction.commit();
    return roster;
  });
}

std::optional<RosterItem> RosterStore::load_one(const std::string& owner, const std::string& contact)
{
  return this->run("loading " + contact + " from the roster of " + owner, [&]() -> std::optional<RosterItem>
  {
    const auto owner_id = this->interner.find(owner);
    const auto contact_id = this->interner.find(contact);
    if (!owner_id || !contact_id)
      return std::nullopt;

    Transaction transaction(this->database);
    const auto row = this->view.select_one(*owner_id, *contact_id);
    if (!row)
      return std::nullopt;
    std::vector<std::string> names;
    for (const auto& group: this->groups.groups_of(*owner_id, *contact_id))
      names.push_back(group.second);
    transaction.commit();
    return this->make_item(*row, names);
  });
}

Roster RosterStore::load_since(const std::string& owner, const std::int64_t version)
{
  return this->run("loading the roster of " + owner + " since version " + std::to_string(version), [&]()
  {
    const auto owner_id = this->interner.find(owner);
    if (!owner_id)
      return Roster{};

    Transaction transaction(this->database);
    auto roster = this->make_roster(*owner_id, this->view.select_since(*owner_id, version));
    transaction.commit();
    return roster;
  });
}

std::int64_t RosterStore::current_version(const std::string& owner)
{
  return this->run("reading the roster version of " + owner, [&]() -> std::int64_t
  {
    const auto owner_id = this->interner.find(owner);
    if (!owner_id)
      return 0;
    return this->view.current_version(*owner_id);
  });
}

RosterItem RosterStore::upsert(const std::string& owner, const RosterItem& item,
                               const bool respect_subscription)
{
  return this->run("saving " + item.jid + " in the roster of " + owner, [&]()
  {
    const auto owner_id = this->interner.resolve(owner);
    const auto contact_id = this->interner.resolve(item.jid);

    Transaction transaction(this->database, Transaction::Mode::Immediate);

    RosterItem result = item;
    result.groups = unique_groups(item.groups);

    std::vector<std::string> group_changes;
    std::set<std::int64_t> stale_groups;
    std::set<std::string> kept_groups;
    for (const auto& group: this->groups.groups_of(owner_id, contact_id))
      {
        if (std::find(result.groups.begin(), result.groups.end(), group.second) == result.groups.end())
          {
            stale_groups.insert(group.first);
            group_changes.push_back(Journal::describe_group_removal(group.second));
          }
        else
          kept_groups.insert(group.second);
      }
    this->groups.remove_members(contact_id, stale_groups);
    for (const auto& name: result.groups)
      {
        if (kept_groups.count(name) != 0)
          continue;
        const auto group_id = this->groups.resolve_group(owner_id, name);
        if (this->groups.add_member(group_id, contact_id))
          group_changes.push_back(Journal::describe_group_addition(name));
      }

    const auto existing = this->view.select_one(owner_id, contact_id);
    if (existing && !is_tombstone(existing->col<Database::SubscriptionState>()))
      {
        auto state = result.subscription.as_bitmask();
        if (!respect_subscription)
          {
            state = existing->col<Database::SubscriptionState>();
            result.subscription = Subscription::from_bitmask(state);
          }
        result.version = this->view.update_item(owner_id, contact_id, result.name, state, group_changes);
      }
    else
      result.version = this->view.add_item(owner_id, contact_id, result.name,
                                           result.subscription.as_bitmask(), group_changes);

    transaction.commit();

    // Same order as the groups of a loaded item
    std::sort(result.groups.begin(), result.groups.end());
    result.remove = false;
    log_debug("Saved ", result.jid, " in the roster of ", owner, ", version ", result.version);
    return result;
  });
}

void RosterStore::remove(const std::string& owner, const std::string& contact)
{
  this->run("removing " + contact + " from the roster of " + owner, [&]()
  {
    const auto owner_id = this->interner.find(owner);
    const auto contact_id = this->interner.find(contact);
    if (!owner_id || !contact_id)
      return;

    Transaction transaction(this->database, Transaction::Mode::Immediate);

    std::vector<std::string> group_changes;
    for (const auto& name: this->groups.remove_from_all_groups(*owner_id, *contact_id))
      group_changes.push_back(Journal::describe_group_removal(name));

    const auto res = this->view.remove_item(*owner_id, *contact_id, group_changes);
    if (res == RosterView::RemoveResult::Absent && !group_changes.empty())
      this->view.group_change(*owner_id, *contact_id, group_changes);

    transaction.commit();
    log_debug("Removed ", contact, " from the roster of ", owner);
  });
}

void RosterStore::wipe(const std::string& owner)
{
  this->run("wiping the roster of " + owner, [&]()
  {
    const auto owner_id = this->interner.find(owner);
    if (!owner_id)
      return;

    Transaction transaction(this->database, Transaction::Mode::Immediate);

    const auto memberships = this->groups.groups_of_owner(*owner_id);
    for (const auto& row: this->view.select(*owner_id))
      {
        const auto contact_id = row.col<Database::ContactId>();
        std::vector<std::string> group_changes;
        const auto it = memberships.find(contact_id);
        if (it != memberships.end())
          for (const auto& name: it->second)
            group_changes.push_back(Journal::describe_group_removal(name));
        this->view.remove_item(*owner_id, contact_id, group_changes);
      }
    const auto removed_groups = this->groups.remove_owner_groups(*owner_id);

    transaction.commit();
    log_info("Wiped the roster of ", owner, " (", removed_groups, " groups deleted)");
  });
}

std::int64_t RosterStore::sweep(const std::chrono::system_clock::time_point& now)
{
  return this->run("sweeping the removed roster items", [&]()
  {
    return this->sweeper.run(now);
  });
}

std::int64_t RosterStore::high_water_mark()
{
  return this->run("reading the last journal entry", [&]()
  {
    return this->journal.high_water_mark();
  });
}

bool RosterStore::schedule_sweeps(TimedEventsManager& events)
{
  // The previous event may belong to another store
  events.cancel(RetentionSweeper::event_name);
  this->sweep_owner.reset();
  this->sweep_events = nullptr;
  if (this->config.sweep_interval.count() <= 0)
    return false;
  this->sweep_owner = std::make_shared<RosterStore*>(this);
  this->sweep_events = &events;
  events.add_event(TimedEvent(std::chrono::duration_cast<std::chrono::milliseconds>(this->config.sweep_interval),
                              [owner = this->sweep_owner]()
                              {
                                try
                                  {
                                    (*owner)->sweep();
                                  }
                                catch (const StoreError& error)
                                  {
                                    log_warning("Scheduled sweep failed: ", error.what());
                                  }
                              },
                              RetentionSweeper::event_name));
  log_info("Sweeping the removed roster items every ", this->config.sweep_interval.count(), "s");
  return true;
}

RosterItem RosterStore::make_item(const Database::RosterViewRow& row, const std::vector<std::string>& groups) const
{
  RosterItem item(row.col<Database::Jid>(), row.col<Database::Name>(), groups);
  const auto state = row.col<Database::SubscriptionState>();
  item.subscription = Subscription::from_bitmask(state);
  item.remove = is_tombstone(state);
  item.version = row.col<Database::Version>();
  return item;
}

Roster RosterStore::make_roster(const std::int64_t owner_id, const std::vector<Database::RosterViewRow>& rows)
{
  const auto memberships = this->groups.groups_of_owner(owner_id);
  static const std::vector<std::string> no_groups;

  Roster roster;
  for (const auto& row: rows)
    {
      const auto it = memberships.find(row.col<Database::ContactId>());
      roster.add_item(this->make_item(row, it == memberships.end() ? no_groups : it->second));
    }
  return roster;
}
