#include "catch2/catch.hpp"
#include "io_tester.hpp"
#include "temporary_database.hpp"

#include <roster/roster_store.hpp>
#include <roster/retention_sweeper.hpp>

#include <database/database.hpp>

#include <utils/timed_events.hpp>
#include <config/config.hpp>
#include <logger/logger.hpp>

#include <chrono>
#include <iostream>
#include <memory>
#include <thread>

using namespace std::chrono_literals;
using namespace std::string_literals;
using Catch::Matchers::Contains;

namespace
{
const std::string alice{"alice@example.com"};
const std::string bob{"bob@example.com"};
const std::string carol{"carol@example.com"};

/**
 * Date the journal entries of the contact far in the past, so that its
 * removal is older than any retention
 */
void make_removal_old(const TemporaryDatabase& temporary, const std::string& contact)
{
  Database database(temporary.get_filename(), 1000);
  REQUIRE(std::get<bool>(database.raw_exec("UPDATE journal SET timestamp='2000-01-01 00:00:00' "
                                           "WHERE contactid=(SELECT jidid FROM jidmap WHERE jid='" + contact + "')")));
}

void refuse_deletions(const TemporaryDatabase& temporary)
{
  Database database(temporary.get_filename(), 1000);
  REQUIRE(std::get<bool>(database.raw_exec("CREATE TRIGGER refuse_delete BEFORE DELETE ON rosteritem "
                                           "BEGIN SELECT RAISE(ABORT, 'deletion refused'); END")));
}
}

TEST_CASE("Sweep the removed roster items")
{
  IoTester<std::ostream> out(std::cout);
  Logger::reset();

  StoreConfig config;
  config.db_file = ":memory:";
  RosterStore store(config);
  CHECK(store.get_config().tombstone_retention == StoreConfig::default_tombstone_retention);

  store.set_item(alice, RosterItem(bob, "Bob"s));
  store.set_item(alice, RosterItem(carol, "Carol"s));
  store.remove(alice, bob);

  const auto now = std::chrono::system_clock::now();

  GIVEN("A sweep before the end of the retention")
    {
      CHECK(store.sweep(now + 24h) == 0);
      THEN("the removed item is still known")
        {
          const auto stored = store.load_one(alice, bob);
          REQUIRE(stored);
          CHECK(stored->remove);
        }
    }
  GIVEN("A sweep after the end of the retention")
    {
      CHECK(store.sweep(now + 96h) == 1);
      THEN("the removed item is gone, the other one is kept")
        {
          const auto stored = store.load_one(alice, bob);
          CHECK_FALSE(stored);
          const auto kept = store.load_one(alice, carol);
          REQUIRE(kept);
          CHECK_FALSE(kept->remove);
          CHECK(store.load(alice).size() == 1);
        }
      THEN("the version of the roster does not go back")
        {
          CHECK(store.current_version(alice) == 3);
        }
    }
  GIVEN("A sweep long after the last change of a live item")
    {
      store.set_item(alice, RosterItem(carol, "Caroline"s));
      CHECK(store.sweep(now + 24h * 1000) == 1);
      THEN("only the removed item is purged")
        {
          const auto kept = store.load_one(alice, carol);
          REQUIRE(kept);
          CHECK(kept->name == "Caroline"s);
        }
    }

  Logger::reset();
}

TEST_CASE("Sweep when the store is opened")
{
  IoTester<std::ostream> out(std::cout);
  Logger::reset();

  TemporaryDatabase temporary;
  {
    RosterStore store(temporary.config());
    store.set_item(alice, RosterItem(bob));
    store.set_item(alice, RosterItem(carol));
    store.remove(alice, bob);
    store.remove(alice, carol);
  }
  make_removal_old(temporary, bob);

  RosterStore store(temporary.config());
  const auto purged = store.load_one(alice, bob);
  CHECK_FALSE(purged);
  const auto kept = store.load_one(alice, carol);
  REQUIRE(kept);
  CHECK(kept->remove);

  Logger::reset();
}

TEST_CASE("Failed sweep when the store is opened")
{
  IoTester<std::ostream> out(std::cout);
  Config::set("log_level", "1");
  Config::set("log_file", "");
  Logger::reset();

  TemporaryDatabase temporary;
  {
    RosterStore store(temporary.config());
    store.set_item(alice, RosterItem(bob));
    store.remove(alice, bob);
  }
  make_removal_old(temporary, bob);
  refuse_deletions(temporary);

  std::unique_ptr<RosterStore> store;
  REQUIRE_NOTHROW(store = std::make_unique<RosterStore>(temporary.config()));
  CHECK_THAT(out.str(), Contains("Failed to purge the removed roster items"));

  const auto kept = store->load_one(alice, bob);
  REQUIRE(kept);
  CHECK(kept->remove);

  // An explicit sweep reports the error
  CHECK_THROWS_AS(store->sweep(), StorageFailure);

  Logger::reset();
}

TEST_CASE("Journal of the purged items")
{
  IoTester<std::ostream> out(std::cout);
  Logger::reset();

  TemporaryDatabase temporary;
  auto config = temporary.config();

  SECTION("Kept by default")
    {
      CHECK_FALSE(config.prune_orphaned_journal);
    }
  SECTION("Pruned when configured")
    {
      config.prune_orphaned_journal = true;
    }

  RosterStore store(config);
  store.set_item(alice, RosterItem(bob));
  store.set_item(alice, RosterItem(carol));
  store.remove(alice, bob);
  CHECK(store.sweep(std::chrono::system_clock::now() + 96h) == 1);

  Database database(temporary.get_filename(), 1000);
  if (config.prune_orphaned_journal)
    CHECK(database.count(Database::journal) == 1);
  else
    CHECK(database.count(Database::journal) == 3);
  CHECK(database.count(Database::rosteritem) == 1);

  Logger::reset();
}

TEST_CASE("Scheduled sweeps")
{
  IoTester<std::ostream> out(std::cout);
  Logger::reset();

  auto& events = TimedEventsManager::instance();
  StoreConfig config;
  config.db_file = ":memory:";

  SECTION("Without an interval")
    {
      // Left by a store that has been replaced
      events.add_event(TimedEvent(3600000ms, []() {}, RetentionSweeper::event_name));
      RosterStore store(config);
      CHECK_FALSE(store.schedule_sweeps(events));
      CHECK(events.find_event(RetentionSweeper::event_name) == nullptr);
    }
  SECTION("With an interval")
    {
      config.sweep_interval = 3600s;
      RosterStore store(config);
      CHECK(store.schedule_sweeps(events));
      // Scheduling again replaces the event
      CHECK(store.schedule_sweeps(events));
      const auto* event = events.find_event(RetentionSweeper::event_name);
      REQUIRE(event != nullptr);
      CHECK(event->repeats());
      CHECK(event->get_repeat_delay() == 3600000ms);
      CHECK(events.cancel(RetentionSweeper::event_name) == 1u);
    }

  CHECK(events.find_event(RetentionSweeper::event_name) == nullptr);
  Logger::reset();
}

TEST_CASE("Scheduled sweep of the removed items")
{
  IoTester<std::ostream> out(std::cout);
  Config::set("log_level", "1");
  Config::set("log_file", "");
  Logger::reset();

  auto& events = TimedEventsManager::instance();
  TemporaryDatabase temporary;
  auto config = temporary.config();
  config.sweep_interval = 1s;

  RosterStore store(config);
  store.set_item(alice, RosterItem(bob));
  store.set_item(alice, RosterItem(carol));
  store.remove(alice, bob);
  make_removal_old(temporary, bob);
  REQUIRE(store.schedule_sweeps(events));

  SECTION("The removed item is purged")
    {
      std::this_thread::sleep_for(1100ms);
      events.execute_expired_events();
      CHECK_FALSE(store.load_one(alice, bob));
      CHECK(store.load_one(alice, carol));
    }
  SECTION("A failed sweep is logged and scheduled again")
    {
      refuse_deletions(temporary);
      std::this_thread::sleep_for(1100ms);
      events.execute_expired_events();
      CHECK_THAT(out.str(), Contains("Scheduled sweep failed"));
      const auto kept = store.load_one(alice, bob);
      REQUIRE(kept);
      CHECK(kept->remove);
      CHECK(events.find_event(RetentionSweeper::event_name) != nullptr);
    }

  CHECK(events.cancel(RetentionSweeper::event_name) == 1u);
  Logger::reset();
}

TEST_CASE("Scheduled sweeps of a destroyed store")
{
  IoTester<std::ostream> out(std::cout);
  Logger::reset();

  auto& events = TimedEventsManager::instance();
  StoreConfig config;
  config.db_file = ":memory:";
  config.sweep_interval = 1s;

  SECTION("They are cancelled with the store")
    {
      {
        RosterStore store(config);
        REQUIRE(store.schedule_sweeps(events));
      }
      CHECK(events.find_event(RetentionSweeper::event_name) == nullptr);
      std::this_thread::sleep_for(1100ms);
      events.execute_expired_events();
    }
  SECTION("The ones of the store replacing it are kept")
    {
      auto previous = std::make_unique<RosterStore>(config);
      REQUIRE(previous->schedule_sweeps(events));
      RosterStore store(config);
      REQUIRE(store.schedule_sweeps(events));
      previous.reset();
      const auto* event = events.find_event(RetentionSweeper::event_name);
      REQUIRE(event != nullptr);
      std::this_thread::sleep_for(1100ms);
      events.execute_expired_events();
      CHECK(events.cancel(RetentionSweeper::event_name) == 1u);
    }

  CHECK(events.find_event(RetentionSweeper::event_name) == nullptr);
  Logger::reset();
}
