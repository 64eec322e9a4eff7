#include "catch2/catch.hpp"

#include <utils/tolower.hpp>
#include <utils/xdg.hpp>
#include <utils/time.hpp>
#include <utils/scopeguard.hpp>

#include <chrono>
#include <cstdlib>
#include <ctime>
#include <stdexcept>

using namespace std::string_literals;

TEST_CASE("tolower")
{
  CHECK(utils::tolower("Alice@Example.COM") == "alice@example.com");
  CHECK(utils::tolower("ROSTERSTORE_DB_NAME") == "rosterstore_db_name");
  CHECK(utils::tolower("").empty());
}

TEST_CASE("xdg_*_path")
{
  ::unsetenv("XDG_CONFIG_HOME");
  ::unsetenv("XDG_DATA_HOME");
  ::unsetenv("HOME");
  std::string res;

  SECTION("Without XDG_CONFIG_HOME nor HOME")
    {
      res = xdg_config_path("coucou.txt");
      CHECK(res == "coucou.txt");
    }
  SECTION("With only HOME")
    {
      ::setenv("HOME", "/home/user", 1);
      res = xdg_config_path("coucou.txt");
      CHECK(res == "/home/user/.config/rosterstore/coucou.txt");
      res = xdg_data_path("roster.sqlite");
      CHECK(res == "/home/user/.local/share/rosterstore/roster.sqlite");
    }
  SECTION("With only XDG_CONFIG_HOME")
    {
      ::setenv("XDG_CONFIG_HOME", "/some_weird_dir", 1);
      res = xdg_config_path("coucou.txt");
      CHECK(res == "/some_weird_dir/rosterstore/coucou.txt");
    }
  SECTION("With a relative XDG_CONFIG_HOME")
    {
      ::setenv("XDG_CONFIG_HOME", "relative", 1);
      ::setenv("HOME", "/home/user", 1);
      res = xdg_config_path("coucou.txt");
      CHECK(res == "/home/user/.config/rosterstore/coucou.txt");
    }
  SECTION("With XDG_DATA_HOME")
    {
      ::setenv("XDG_DATA_HOME", "/datadir", 1);
      res = xdg_data_path("bonjour.txt");
      CHECK(res == "/datadir/rosterstore/bonjour.txt");
    }
  ::unsetenv("XDG_CONFIG_HOME");
  ::unsetenv("XDG_DATA_HOME");
}

TEST_CASE("to_sql_timestamp")
{
  const std::time_t stamp = 1472480968;
  const std::string result = "2016-08-29 14:29:28";
  CHECK(utils::to_sql_timestamp(stamp) == result);
  CHECK(utils::to_sql_timestamp(0) == "1970-01-01 00:00:00");

  const auto time_point = std::chrono::system_clock::from_time_t(stamp);
  CHECK(utils::to_sql_timestamp(time_point) == result);
  CHECK(utils::to_sql_timestamp(time_point + std::chrono::hours(72)) == "2016-09-01 14:29:28");
  // Sorting the strings sorts the dates
  CHECK(utils::to_sql_timestamp(time_point) < utils::to_sql_timestamp(time_point + std::chrono::seconds(1)));
}

TEST_CASE("scope_guard")
{
  bool res = false;
  {
    auto guard = utils::make_scope_guard([&res](){ res = true; });
    CHECK(!res);
  }
  CHECK(res);

  int calls = 0;
  try
    {
      const auto guard = utils::make_scope_guard([&calls]() { calls++; });
      throw std::runtime_error("leaving the scope");
    }
  catch (const std::runtime_error&)
    {
      CHECK(calls == 1);
    }
  CHECK(calls == 1);
}
