#include <roster/retention_sweeper.hpp>
#include <roster/journal.hpp>

#include <database/database.hpp>
#include <database/delete_query.hpp>
#include <database/errors.hpp>

#include <xmpp/subscription.hpp>
#include <utils/time.hpp>
#include <logger/logger.hpp>

RetentionSweeper::RetentionSweeper(Database& database, Journal& journal,
                                   const std::chrono::seconds& retention, const bool prune_orphaned_journal):
    database(database),
    journal(journal),
    retention(retention),
    prune_orphaned_journal(prune_orphaned_journal)
{
}

std::int64_t RetentionSweeper::run(const std::chrono::system_clock::time_point& now)
{
  const auto cutoff = utils::to_sql_timestamp(now - this->retention);

  Transaction transaction(this->database, Transaction::Mode::Immediate);

  // The date of a removal is the one of the last journal entry of the
  // item. An item removed without any journal entry is purged right away.
  DeleteQuery query(Database::rosteritem.get_name());
  query.where() << Database::SubscriptionState{} << ">=" << Subscription::tombstone_bit << \
          " AND ifnull((SELECT j.timestamp FROM journal j"
          " WHERE j.userid=rosteritem.userid AND j.contactid=rosteritem.contactid"
          " ORDER BY j.entry DESC LIMIT 1), '') < " << cutoff;
  const auto purged = query.execute(this->database.engine());

  if (this->prune_orphaned_journal)
    this->journal.prune_orphans();

  transaction.commit();

  if (purged > 0)
    log_info("Purged ", purged, " roster items removed before ", cutoff);
  else
    log_debug("No roster item removed before ", cutoff);
  return purged;
}

std::int64_t RetentionSweeper::run_safely(const std::chrono::system_clock::time_point& now)
{
  try
    {
      return this->run(now);
    }
  catch (const StoreError& error)
    {
      log_error("Failed to purge the removed roster items: ", error.what());
      return 0;
    }
}
