#pragma once

#include <database/table.hpp>
#include <database/column.hpp>
#include <database/count_query.hpp>

#include <database/engine.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <memory>
#include <tuple>

/**
 * One connection to a roster database, and the description of the schema
 * it contains.
 *
 * Opening a database installs (or upgrades) the schema. The connection is
 * closed when the object is destroyed.
 */
class Database
{
 public:
  struct JidId: IdColumn { static constexpr auto name = "jidid"; };

  struct Jid: Column<std::string> { static constexpr auto name = "jid";
    static constexpr auto options = "NOT NULL"; };

  struct UserId: Column<std::int64_t> { static constexpr auto name = "userid"; };

  struct ContactId: Column<std::int64_t> { static constexpr auto name = "contactid"; };

  struct Name: Column<std::optional<std::string>> { static constexpr auto name = "name"; };

  struct SubscriptionState: Column<std::int64_t> { static constexpr auto name = "subscription";
    static constexpr auto options = "NOT NULL DEFAULT 0"; };

  struct GroupId: IdColumn { static constexpr auto name = "groupid"; };

  struct GroupName: Column<std::string> { static constexpr auto name = "name"; };

  struct MemberGroupId: Column<std::int64_t> { static constexpr auto name = "groupid"; };

  struct Entry: IdColumn { static constexpr auto name = "entry"; };

  struct Timestamp: Column<std::string> { static constexpr auto name = "timestamp";
    static constexpr auto options = "NOT NULL DEFAULT CURRENT_TIMESTAMP"; };

  struct Operation: Column<std::string> { static constexpr auto name = "operation";
    static constexpr auto options = "NOT NULL"; };

  struct Version: Column<std::int64_t> { static constexpr auto name = "version"; };

  using JidMapTable = Table<JidId, Jid>;
  using Identity = JidMapTable::RowType;

  using RosterItemTable = Table<UserId, ContactId, Name, SubscriptionState>;
  using RosterItemRow = RosterItemTable::RowType;

  using RosterGroupTable = Table<GroupId, UserId, GroupName>;
  using RosterGroup = RosterGroupTable::RowType;

  using GroupItemTable = Table<MemberGroupId, ContactId>;
  using GroupItem = GroupItemTable::RowType;

  using JournalTable = Table<Entry, UserId, ContactId, Timestamp, Operation>;
  using JournalEntry = JournalTable::RowType;

  /**
   * A row of the roster view: a roster item joined with the contact
   * address and the version derived from the journal.
   */
  using RosterViewRow = Row<ContactId, Jid, Name, SubscriptionState, Version>;

  /**
   * Open (and create if needed) the database file, then install the schema.
   * Throws a StorageFailure if the file cannot be opened or the schema
   * cannot be installed.
   */
  Database(const std::string& filename, const int busy_timeout_ms);
  ~Database() = default;

  Database(const Database&) = delete;
  Database(Database&&) = delete;
  Database& operator=(const Database&) = delete;
  Database& operator=(Database&&) = delete;

  DatabaseEngine& engine()
  {
    return *this->db;
  }

  auto raw_exec(const std::string& query)
  {
    return this->db->raw_exec(query);
  }

  template <typename TableType>
  std::int64_t count(const TableType& table)
  {
    CountQuery query{table.get_name()};
    return query.execute(*this->db);
  }

  static const JidMapTable jidmap;
  static const RosterItemTable rosteritem;
  static const RosterGroupTable rostergroup;
  static const GroupItemTable groupitem;
  static const JournalTable journal;
  static constexpr auto roster_view = "roster";
  static constexpr auto legacy_roster_table = "roster";

 private:
  void install_schema();
  void upgrade_legacy_schema();

  std::unique_ptr<DatabaseEngine> db;
};

/**
 * A transaction, rolled back when it goes out of scope unless commit() has
 * been called.
 */
class Transaction
{
public:
  enum class Mode
  {
    /** Takes the locks when the first statement needs them */
    Deferred,
    /** Takes the write lock right away */
    Immediate,
  };

  Transaction(Database& database, const Mode mode=Mode::Deferred);
  ~Transaction();

  Transaction(const Transaction&) = delete;
  Transaction(Transaction&&) = delete;
  Transaction& operator=(const Transaction&) = delete;
  Transaction& operator=(Transaction&&) = delete;

  void commit();
  void rollback();

private:
  Database& database;
  bool open{false};
};
