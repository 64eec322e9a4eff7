#include "catch2/catch.hpp"
#include "io_tester.hpp"
#include "temporary_database.hpp"

#include <database/database.hpp>
#include <database/select_query.hpp>
#include <database/insert_query.hpp>
#include <database/delete_query.hpp>
#include <database/count_query.hpp>
#include <database/errors.hpp>

#include <logger/logger.hpp>
#include <config/config.hpp>

#include <set>
#include <iostream>

namespace
{
bool exec(Database& database, const std::string& query)
{
  return std::get<bool>(database.raw_exec(query));
}
}

TEST_CASE("Database schema")
{
  IoTester<std::ostream> out(std::cout);
  Logger::reset();

  Database database(":memory:", 1000);
  auto& engine = database.engine();

  SECTION("All the tables, the view and the index are created")
    {
      CHECK(engine.has_relation("jidmap", "table"));
      CHECK(engine.has_relation("rosteritem", "table"));
      CHECK(engine.has_relation("rostergroup", "table"));
      CHECK(engine.has_relation("groupitem", "table"));
      CHECK(engine.has_relation("journal", "table"));
      CHECK(engine.has_relation("roster", "view"));
      CHECK(engine.has_relation("journal_pair_index", "index"));
      CHECK_FALSE(engine.has_relation("roster", "table"));

      const std::set<std::string> journal_columns{"entry", "userid", "contactid", "timestamp", "operation"};
      CHECK(engine.get_all_columns_from_table("journal") == journal_columns);
    }
  SECTION("Insert and select")
    {
      auto identity = Database::jidmap.row();
      identity.col<Database::Jid>() = "alice@example.com";
      REQUIRE(insert(identity, engine) == StepResult::Done);
      CHECK(identity.col<Database::JidId>() == 1);

      auto other = Database::jidmap.row();
      other.col<Database::Jid>() = "bob@example.com";
      REQUIRE(insert(other, engine) == StepResult::Done);
      CHECK(other.col<Database::JidId>() == 2);

      auto request = select(Database::jidmap);
      request.where() << Database::Jid{} << "=" << "bob@example.com"s;
      const auto result = request.execute(engine);
      REQUIRE(result.size() == 1);
      CHECK(result.front().col<Database::JidId>() == 2);

      CHECK(database.count(Database::jidmap) == 2);
    }
  SECTION("A unique constraint violation is reported, not thrown")
    {
      auto identity = Database::jidmap.row();
      identity.col<Database::Jid>() = "alice@example.com";
      REQUIRE(insert(identity, engine) == StepResult::Done);
      auto duplicate = Database::jidmap.row();
      duplicate.col<Database::Jid>() = "alice@example.com";
      CHECK(insert(duplicate, engine) == StepResult::Constraint);
      CHECK(duplicate.col<Database::JidId>() == IdColumn::unset_value);
      CHECK(database.count(Database::jidmap) == 1);
    }
  SECTION("INSERT OR IGNORE")
    {
      auto member = Database::groupitem.row();
      member.col<Database::MemberGroupId>() = 1;
      member.col<Database::ContactId>() = 2;
      CHECK(insert_or_ignore(member, engine));
      CHECK_FALSE(insert_or_ignore(member, engine));
      CHECK(database.count(Database::groupitem) == 1);
    }
  SECTION("NULL values")
    {
      auto item = Database::rosteritem.row();
      item.col<Database::UserId>() = 1;
      item.col<Database::ContactId>() = 2;
      REQUIRE(insert(item, engine) == StepResult::Done);
      item.col<Database::ContactId>() = 3;
      item.col<Database::Name>() = "Carol";
      REQUIRE(insert(item, engine) == StepResult::Done);

      auto request = select(Database::rosteritem);
      request.order_by() << Database::ContactId{};
      const auto result = request.execute(engine);
      REQUIRE(result.size() == 2);
      CHECK_FALSE(result[0].col<Database::Name>());
      CHECK(result[1].col<Database::Name>() == "Carol");
    }
  SECTION("Delete returns the number of deleted rows")
    {
      for (const auto& jid: {"a@example.com", "b@example.com", "c@example.com"})
        {
          auto identity = Database::jidmap.row();
          identity.col<Database::Jid>() = jid;
          REQUIRE(insert(identity, engine) == StepResult::Done);
        }
      DeleteQuery query(Database::jidmap.get_name());
      query.where() << Database::JidId{} << "<" << 3;
      CHECK(query.execute(engine) == 2);
      CHECK(database.count(Database::jidmap) == 1);
    }
  SECTION("Scalar queries")
    {
      ScalarQuery empty{"SELECT max(entry) FROM journal"};
      CHECK_FALSE(empty.execute(engine));
      ScalarQuery value{"SELECT "};
      value << 40 << " + " << 2;
      CHECK(value.execute(engine) == 42);
    }
  SECTION("An invalid query throws")
    {
      Query query{"SELECT * FROM does_not_exist"};
      CHECK_THROWS_AS(query.execute(engine), StorageFailure);
    }
  Logger::reset();
}

TEST_CASE("Transactions")
{
  IoTester<std::ostream> out(std::cout);
  Logger::reset();

  Database database(":memory:", 1000);

  auto insert_identity = [&database](const std::string& jid)
  {
    auto identity = Database::jidmap.row();
    identity.col<Database::Jid>() = jid;
    REQUIRE(insert(identity, database.engine()) == StepResult::Done);
  };

  SECTION("Committed")
    {
      Transaction transaction(database, Transaction::Mode::Immediate);
      insert_identity("alice@example.com");
      transaction.commit();
      CHECK(database.count(Database::jidmap) == 1);
    }
  SECTION("Rolled back when not committed")
    {
      {
        Transaction transaction(database, Transaction::Mode::Immediate);
        insert_identity("alice@example.com");
      }
      CHECK(database.count(Database::jidmap) == 0);
    }
  SECTION("Rolled back when an exception is thrown")
    {
      try
        {
          Transaction transaction(database);
          insert_identity("alice@example.com");
          throw StorageFailure("test");
        }
      catch (const StorageFailure&)
        {
        }
      CHECK(database.count(Database::jidmap) == 0);
    }
  SECTION("Nested transactions are refused")
    {
      Transaction transaction(database);
      CHECK_THROWS_AS(Transaction(database), StorageFailure);
    }
  Logger::reset();
}

TEST_CASE("Legacy schema upgrade")
{
  IoTester<std::ostream> out(std::cout);
  Logger::reset();

  TemporaryDatabase file;
  const auto& filename = file.get_filename();

  {
    // The database of the trigger-based versions, without the journal
    Database legacy(filename, 1000);
    REQUIRE(exec(legacy, "DROP VIEW roster"));
    REQUIRE(exec(legacy, "DROP TABLE rosteritem"));
    REQUIRE(exec(legacy, "DROP TABLE journal"));
    REQUIRE(exec(legacy, "CREATE TABLE roster (userid INTEGER NOT NULL, contactid INTEGER NOT NULL,"
                         " name VARCHAR(255), PRIMARY KEY (userid, contactid))"));
    REQUIRE(exec(legacy, "INSERT INTO jidmap (jid) VALUES ('alice@example.com'), ('bob@example.com')"));
    REQUIRE(exec(legacy, "INSERT INTO roster (userid, contactid, name) VALUES (1, 2, 'Bob')"));
    REQUIRE(exec(legacy, "CREATE TRIGGER roster_ver_add_grp AFTER INSERT ON groupitem"
                         " BEGIN DELETE FROM jidmap; END"));
  }

  Database database(filename, 1000);
  auto& engine = database.engine();
  CHECK(engine.has_relation("rosteritem", "table"));
  CHECK(engine.has_relation("roster", "view"));
  CHECK_FALSE(engine.has_relation("roster", "table"));
  CHECK_FALSE(engine.has_relation("roster_ver_add_grp", "trigger"));
  CHECK(engine.get_all_columns_from_table("rosteritem").count("subscription") == 1);

  SelectQuery<Database::ContactId, Database::Jid, Database::Name,
              Database::SubscriptionState, Database::Version> request{Database::roster_view};
  const auto rows = request.execute(engine);
  REQUIRE(rows.size() == 1);
  CHECK(rows[0].col<Database::Jid>() == "bob@example.com");
  CHECK(rows[0].col<Database::Name>() == "Bob");
  CHECK(rows[0].col<Database::SubscriptionState>() == 0);
  // Never changed since versioning exists
  CHECK(rows[0].col<Database::Version>() == 0);

  // The dropped trigger would have emptied jidmap
  auto member = Database::groupitem.row();
  member.col<Database::MemberGroupId>() = 1;
  member.col<Database::ContactId>() = 2;
  REQUIRE(insert(member, engine) == StepResult::Done);
  CHECK(database.count(Database::jidmap) == 2);

  Logger::reset();
}
