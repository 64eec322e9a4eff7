#include <database/database.hpp>
#include <database/sqlite3_engine.hpp>
#include <database/errors.hpp>
#include <database/index.hpp>

#include <logger/logger.hpp>

#include <memory>

const Database::JidMapTable Database::jidmap("jidmap", "UNIQUE (jid)");
const Database::RosterItemTable Database::rosteritem("rosteritem", "PRIMARY KEY (userid, contactid)");
const Database::RosterGroupTable Database::rostergroup("rostergroup", "UNIQUE (userid, name)");
const Database::GroupItemTable Database::groupitem("groupitem", "PRIMARY KEY (groupid, contactid)");
const Database::JournalTable Database::journal("journal");

namespace
{
// Written by the trigger-based versions of the schema. Journal rows are
// now appended explicitly, keeping those would record every change twice.
constexpr const char* legacy_triggers[] = {
  "roster_ver_add_item",
  "roster_ver_upd_item",
  "roster_ver_rem_item",
  "roster_ver_del_item",
  "roster_ver_add_grp",
  "roster_ver_del_grp",
};

constexpr auto roster_view_definition =
    "CREATE VIEW IF NOT EXISTS roster AS"
    " SELECT r.userid AS userid, r.contactid AS contactid, r.name AS name,"
    " r.subscription AS subscription, jm.jid AS user, jmc.jid AS jid,"
    " ifnull(rv.ver, 0) AS version"
    " FROM rosteritem r"
    " INNER JOIN jidmap jm ON jm.jidid=r.userid"
    " INNER JOIN jidmap jmc ON jmc.jidid=r.contactid"
    " LEFT OUTER JOIN"
    " (SELECT userid, contactid, max(entry) AS ver FROM journal GROUP BY userid, contactid) rv"
    " ON rv.userid=r.userid AND rv.contactid=r.contactid";

void exec_or_throw(Database& database, const std::string& query)
{
  const auto result = database.raw_exec(query);
  if (std::get<bool>(result) == false)
    {
      log_error("Error executing query ", query, ": ", std::get<std::string>(result));
      throw StorageFailure("Failed to execute query \"" + query + "\": " + std::get<std::string>(result));
    }
}
}

Database::Database(const std::string& filename, const int busy_timeout_ms):
    db(Sqlite3Engine::open(filename, busy_timeout_ms))
{
  this->install_schema();
  log_info("Using roster database ", filename);
}

void Database::install_schema()
{
  // Two processes may open a new file at the same time
  Transaction transaction(*this, Transaction::Mode::Immediate);

  this->upgrade_legacy_schema();

  Database::jidmap.create(*this->db);
  Database::jidmap.upgrade(*this->db);
  Database::rosteritem.create(*this->db);
  Database::rosteritem.upgrade(*this->db);
  Database::rostergroup.create(*this->db);
  Database::rostergroup.upgrade(*this->db);
  Database::groupitem.create(*this->db);
  Database::groupitem.upgrade(*this->db);
  Database::journal.create(*this->db);
  Database::journal.upgrade(*this->db);

  create_index<Database::UserId, Database::ContactId>(*this->db, "journal_pair_index", Database::journal.get_name());

  exec_or_throw(*this, roster_view_definition);

  transaction.commit();
}

void Database::upgrade_legacy_schema()
{
  for (const auto& trigger: legacy_triggers)
    {
      if (this->db->has_relation(trigger, "trigger"))
        {
          exec_or_throw(*this, "DROP TRIGGER IF EXISTS "s + trigger);
          log_info("Dropped legacy trigger ", trigger);
        }
    }

  if (!this->db->has_relation(Database::legacy_roster_table, "table"))
    return;
  if (this->db->has_relation(Database::rosteritem.get_name(), "table"))
    {
      log_error("The database contains both a legacy ", Database::legacy_roster_table,
                " table and a ", Database::rosteritem.get_name(), " table");
      throw StorageFailure("Cannot upgrade the legacy roster table: "s + Database::rosteritem.get_name() + " already exists");
    }
  exec_or_throw(*this, "ALTER TABLE "s + Database::legacy_roster_table + " RENAME TO " + Database::rosteritem.get_name());
  log_info("Renamed legacy table ", Database::legacy_roster_table, " to ", Database::rosteritem.get_name());
}

Transaction::Transaction(Database& database, const Mode mode):
    database(database)
{
  const auto result = this->database.raw_exec(mode == Mode::Immediate ? "BEGIN IMMEDIATE": "BEGIN");
  if (std::get<bool>(result) == false)
    {
      log_error("Failed to create SQL transaction: ", std::get<std::string>(result));
      throw StorageFailure("Failed to create SQL transaction: " + std::get<std::string>(result));
    }
  this->open = true;
}

Transaction::~Transaction()
{
  if (this->open)
    this->rollback();
}

void Transaction::commit()
{
  const auto result = this->database.raw_exec("COMMIT");
  if (std::get<bool>(result) == false)
    {
      log_error("Failed to commit SQL transaction: ", std::get<std::string>(result));
      throw StorageFailure("Failed to commit SQL transaction: " + std::get<std::string>(result));
    }
  this->open = false;
}

void Transaction::rollback()
{
  this->open = false;
  const auto result = this->database.raw_exec("ROLLBACK");
  if (std::get<bool>(result) == false)
    log_error("Failed to roll back SQL transaction: ", std::get<std::string>(result));
}
