#include "catch2/catch.hpp"

#include <logger/logger.hpp>
#include <config/config.hpp>

#include "io_tester.hpp"
#include <iostream>
#include <thread>
#include <vector>

using namespace std::string_literals;
using Catch::Matchers::StartsWith;
using Catch::Matchers::EndsWith;

TEST_CASE("Basic logging")
{
  const std::string debug_header = "[DEBUG]: ";
  const std::string error_header = "[ERROR]: ";
  // The logger writes where std::cout pointed when it was created
  IoTester<std::ostream> out(std::cout);
  Logger::reset();
  GIVEN("A logger with log_level 0")
    {
      Config::set("log_level", "0");
      WHEN("we log some debug text")
        {
          log_debug("deb", "ug");
          const auto line = std::to_string(__LINE__ - 1);
          THEN("debug logs are written")
            {
              CHECK_THAT(out.str(), StartsWith(debug_header));
              CHECK_THAT(out.str(), EndsWith("logger.cpp:" + line + ":\tdebug\n"));
            }
        }
      WHEN("we log some errors")
        {
          log_error("err", 12, "or");
          const auto line = std::to_string(__LINE__ - 1);
          THEN("error logs are written")
            {
              CHECK_THAT(out.str(), StartsWith(error_header));
              CHECK_THAT(out.str(), EndsWith("logger.cpp:" + line + ":\terr12or\n"));
            }
        }
    }
  GIVEN("A logger with log_level 3")
    {
      Config::set("log_level", "3");
      WHEN("we log some debug text")
        {
          log_debug(123, "debug");
          THEN("nothing is written")
            CHECK(out.str().empty());
        }
      WHEN("we log some warnings")
        {
          log_warning("careful");
          THEN("nothing is written")
            CHECK(out.str().empty());
        }
      WHEN("we log some errors")
        {
          log_error(123, " errors");
          THEN("error logs are still written")
            CHECK_THAT(out.str(), EndsWith(":\t123 errors\n"));
        }
    }
  Logger::reset();
  Config::clear();
}

TEST_CASE("Logging from several threads")
{
  IoTester<std::ostream> out(std::cout);
  Logger::reset();
  Config::set("log_level", "1");

  constexpr int threads_number = 4;
  constexpr int lines_per_thread = 50;
  std::vector<std::thread> threads;
  for (int i = 0; i < threads_number; i++)
    threads.emplace_back([i]()
                         {
                           for (int j = 0; j < lines_per_thread; j++)
                             log_info("thread ", i, " line ", j);
                         });
  for (auto& thread: threads)
    thread.join();

  const auto lines = out.lines();
  CHECK(lines.size() == threads_number * lines_per_thread);
  for (const auto& line: lines)
    {
      CHECK_THAT(line, StartsWith("[INFO]: "));
      CHECK_THAT(line, Catch::Matchers::Contains("\tthread "));
    }

  Logger::reset();
  Config::clear();
}

TEST_CASE("Log levels")
{
  CHECK(Logger::parse_level("0") == debug_lvl);
  CHECK(Logger::parse_level("2") == warning_lvl);
  CHECK(Logger::parse_level("info") == info_lvl);
  CHECK(Logger::parse_level("Warning") == warning_lvl);
  CHECK(Logger::parse_level("error") == error_lvl);
  CHECK(Logger::parse_level("verbose") == debug_lvl);

  IoTester<std::ostream> out(std::cout);
  Logger::reset();
  Config::set("log_level", "warning");
  log_info("hidden");
  log_warning("shown");
  const auto lines = out.lines();
  REQUIRE(lines.size() == 1);
  CHECK_THAT(lines.front(), StartsWith("[WARNING]: "));
  CHECK_THAT(lines.front(), EndsWith(":\tshown"));

  Logger::reset();
  Config::clear();
}

TEST_CASE("Log file that cannot be opened")
{
  IoTester<std::ostream> out(std::cout);
  IoTester<std::ostream> err(std::cerr);
  Logger logger(info_lvl, "/nonexistent/directory/rosterstore.log");
  CHECK_THAT(err.str(), StartsWith("Could not open the log file"));

  CHECK_FALSE(logger.accepts(debug_lvl));
  CHECK(logger.accepts(error_lvl));
  logger.write(error_lvl, LOG_ERR, "journal.cpp", 42, "failed");
  CHECK(out.str() == "[ERROR]: journal.cpp:42:\tfailed\n");
}
