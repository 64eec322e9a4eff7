#include <roster/roster_store.hpp>
#include <roster/reload.hpp>
#include <database/errors.hpp>
#include <utils/timed_events.hpp>
#include <config/config.hpp>
#include <logger/logger.hpp>
#include <utils/xdg.hpp>
#include <utils/scopeguard.hpp>

#include <algorithm>
#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <chrono>
#include <ctime>
#include <iostream>
#include <string>
#include <vector>

namespace
{
const std::vector<std::string> commands{"dump", "remove", "wipe", "sweep", "run"};

bool is_command(const std::string& arg)
{
  return std::find(commands.begin(), commands.end(), arg) != commands.end();
}
}

/**
 * Provide an helpful message to help the user write a minimal working
 * configuration file.
 */
int config_help(const std::string& filename)
{
  log_error("Could not read the configuration file ", filename, ".");
  log_error("Please provide a configuration file filled like this:\n\n"
            "db_name=/var/lib/rosterstore/roster.sqlite\ntombstone_retention=259200");
  return 1;
}

int display_help()
{
  std::cout << "Usage: rosterstore [configuration_file] <command> [arguments]\n\n"
               "Commands:\n"
               "  dump <owner> [version]    print the roster of owner, or only the items\n"
               "                            changed after that version\n"
               "  remove <owner> <contact>  remove a contact from the roster of owner\n"
               "  wipe <owner>              remove all the contacts and groups of owner\n"
               "  sweep                     purge the removed items older than the\n"
               "                            retention period\n"
               "  run                       stay in the foreground, sweeping every\n"
               "                            sweep_interval seconds" << std::endl;
  return 0;
}

int usage_error(const std::string& message)
{
  std::cerr << message << std::endl;
  std::cerr << "See rosterstore --help" << std::endl;
  return 1;
}

void print_item(const RosterItem& item)
{
  std::cout << item.version << "\t" << item.jid << "\t";
  std::cout << (item.name ? *item.name : "") << "\t" << item.subscription.to_string();
  if (item.subscription.pending_out())
    std::cout << "+pending-out";
  if (item.subscription.pending_in())
    std::cout << "+pending-in";
  std::cout << "\t";
  for (auto it = item.groups.begin(); it != item.groups.end(); ++it)
    {
      if (it != item.groups.begin())
        std::cout << ",";
      std::cout << *it;
    }
  if (item.remove)
    std::cout << "\t(removed)";
  std::cout << std::endl;
}

int dump(RosterStore& store, const std::vector<std::string>& args)
{
  if (args.empty() || args.size() > 2)
    return usage_error("Usage: rosterstore dump <owner> [version]");
  const auto& owner = args[0];
  Roster roster;
  if (args.size() == 2)
    {
      char* end;
      const auto version = std::strtoll(args[1].data(), &end, 10);
      if (args[1].empty() || *end != '\0' || version < 0)
        return usage_error("Invalid version: " + args[1]);
      roster = store.load_since(owner, version);
    }
  else
    roster = store.load(owner);
  std::cout << "Roster of " << owner << ", version " << store.current_version(owner)
            << " (last journal entry: " << store.high_water_mark() << ")" << std::endl;
  for (const auto& item: roster.get_items())
    print_item(item);
  return 0;
}

int run(std::unique_ptr<RosterStore>& store)
{
  // Block the signals we want to manage: they are only received by the
  // sigtimedwait call below
  sigset_t mask{};
  sigemptyset(&mask);
  sigaddset(&mask, SIGINT);
  sigaddset(&mask, SIGTERM);
  sigaddset(&mask, SIGUSR1);
  sigaddset(&mask, SIGUSR2);
  sigprocmask(SIG_BLOCK, &mask, nullptr);

  auto& events = TimedEventsManager::instance();
  const auto cancel_events = utils::make_scope_guard([&events]()
  {
    events.cancel(RetentionSweeper::event_name);
    events.cancel("watchdog");
  });
  store->schedule_sweeps(events);

#ifdef SYSTEMD_FOUND
  sd_notify(0, "READY=1");
  // Install an event that sends a keepalive to systemd.  If rosterstore
  // hangs for too long, systemd will restart it.
  uint64_t usec;
  if (sd_watchdog_enabled(0, &usec) > 0)
    {
      events.add_event(TimedEvent(
             std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::microseconds(usec / 2)),
             []() { sd_notify(0, "WATCHDOG=1"); }, "watchdog"));
    }
#endif
  log_info("Running, waiting for signals.");

  while (true)
    {
      events.execute_expired_events();
      const auto timeout = events.get_timeout();

      siginfo_t info;
      int sig;
      if (timeout == utils::no_timeout)
        sig = sigwaitinfo(&mask, &info);
      else
        {
          const auto seconds = std::chrono::duration_cast<std::chrono::seconds>(timeout);
          const auto nanoseconds = std::chrono::duration_cast<std::chrono::nanoseconds>(timeout - seconds);
          const timespec ts{static_cast<std::time_t>(seconds.count()), static_cast<long>(nanoseconds.count())};
          sig = sigtimedwait(&mask, &info, &ts);
        }

      if (sig == -1)
        {
          if (errno == EAGAIN || errno == EINTR)
            continue;
          log_error("Failed to wait for signals: ", std::strerror(errno));
          return 1;
        }
      if (sig == SIGINT || sig == SIGTERM)
        {
          log_info("Signal received, exiting...");
#ifdef SYSTEMD_FOUND
          sd_notify(0, "STOPPING=1");
#endif
          break;
        }
      log_info("Signal received, reloading the config...");
      ::reload_process(store);
      store->schedule_sweeps(events);
    }
  log_info("Exiting, have a nice day.");
  return 0;
}

int main(int ac, char** av)
{
  std::vector<std::string> args(av + 1, av + ac);
  if (!args.empty())
    {
      const std::string& arg = args.front();
      if (arg.size() >= 2 && arg[0] == '-' && arg[1] == '-')
        {
          if (arg == "--help")
            return display_help();
          else
            return usage_error("Unknow command line option: " + arg);
        }
    }
  std::string conf_filename = xdg_config_path("rosterstore.cfg");
  if (!args.empty() && !is_command(args.front()))
    {
      conf_filename = args.front();
      args.erase(args.begin());
    }
  if (args.empty())
    return usage_error("No command given");
  const std::string command = args.front();
  args.erase(args.begin());
  if (!is_command(command))
    return usage_error("Unknown command: " + command);

  std::cout << "Using configuration file: " << conf_filename << std::endl;
  if (!Config::read_conf(conf_filename))
    return config_help(conf_filename);

  try
    {
      auto store = open_store();

      if (command == "dump")
        return dump(*store, args);
      else if (command == "remove")
        {
          if (args.size() != 2)
            return usage_error("Usage: rosterstore remove <owner> <contact>");
          store->remove(args[0], args[1]);
        }
      else if (command == "wipe")
        {
          if (args.size() != 1)
            return usage_error("Usage: rosterstore wipe <owner>");
          store->wipe(args[0]);
        }
      else if (command == "sweep")
        {
          if (!args.empty())
            return usage_error("Usage: rosterstore sweep");
          std::cout << store->sweep() << " removed items purged" << std::endl;
        }
      else
        {
          if (!args.empty())
            return usage_error("Usage: rosterstore run");
          return run(store);
        }
    }
  catch (const StoreError& error)
    {
      std::cerr << error.what() << std::endl;
      return 1;
    }
  return 0;
}
