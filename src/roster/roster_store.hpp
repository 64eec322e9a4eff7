#pragma once

#include <roster/roster_storage.hpp>
#include <roster/store_config.hpp>
#include <roster/identity_interner.hpp>
#include <roster/group_catalog.hpp>
#include <roster/journal.hpp>
#include <roster/roster_view.hpp>
#include <roster/retention_sweeper.hpp>

#include <database/database.hpp>

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

class TimedEventsManager;

/**
 * The versioned rosters kept in a SQLite database.
 *
 * Every change of an item gets a new journal entry, whose number becomes
 * the version of the item. Removed items are kept, marked as such, until
 * the retention sweeper purges them.
 *
 * All the operations are synchronous. They can be called from several
 * threads: they are run one at a time. Each write happens in a single
 * transaction; if it throws, nothing has been changed.
 */
class RosterStore: public RosterStorage
{
public:
  /**
   * Open the database and purge the old removed items. Throws
   * NotConfigured if the configuration has no database file, or
   * StorageFailure if it cannot be opened.
   */
  explicit RosterStore(StoreConfig config);
  /**
   * Cancel the scheduled sweeps of this store, if they have not been
   * replaced by the ones of another store.
   */
  ~RosterStore();

  RosterStore(const RosterStore&) = delete;
  RosterStore(RosterStore&&) = delete;
  RosterStore& operator=(const RosterStore&) = delete;
  RosterStore& operator=(RosterStore&&) = delete;

  Roster load(const std::string& owner) override;
  std::optional<RosterItem> load_one(const std::string& owner, const std::string& contact) override;
  Roster load_since(const std::string& owner, const std::int64_t version) override;
  std::int64_t current_version(const std::string& owner) override;
  RosterItem upsert(const std::string& owner, const RosterItem& item,
                    const bool respect_subscription) override;
  /**
   * Remove the contact from the roster. The item is kept, marked as
   * removed, until the next remove or the retention sweeper deletes it.
   */
  void remove(const std::string& owner, const std::string& contact) override;
  /**
   * Remove all the contacts of the owner, and delete all its groups.
   */
  void wipe(const std::string& owner) override;
  bool supports_versioning() const override
  {
    return true;
  }

  /**
   * Purge the items removed before now - retention. Returns the number of
   * purged items.
   */
  std::int64_t sweep(const std::chrono::system_clock::time_point& now=std::chrono::system_clock::now());
  /**
   * The number of the last journal entry, of any roster. No version
   * handed to a client can be greater than this one.
   */
  std::int64_t high_water_mark();
  /**
   * Replace the sweep event of any previous store by a repeating event
   * running the sweep of this one, if a sweep interval is configured.
   * Returns whether it has been added.
   */
  bool schedule_sweeps(TimedEventsManager& events);

  const StoreConfig& get_config() const
  {
    return this->config;
  }

private:
  template <typename Callable>
  auto run(const std::string& context, Callable&& operation);

  RosterItem make_item(const Database::RosterViewRow& row, const std::vector<std::string>& groups) const;
  Roster make_roster(const std::int64_t owner_id, const std::vector<Database::RosterViewRow>& rows);

  const StoreConfig config;
  Database database;
  IdentityInterner interner;
  GroupCatalog groups;
  Journal journal;
  RosterView view;
  RetentionSweeper sweeper;
  std::mutex mutex;
  /**
   * Copied into the scheduled sweep event. Its use count tells whether
   * that event still exists.
   */
  std::shared_ptr<RosterStore*> sweep_owner;
  TimedEventsManager* sweep_events{nullptr};
};
