#pragma once

#include <functional>
#include <string>
#include <chrono>
#include <list>

using namespace std::literals::chrono_literals;

namespace utils {
static constexpr std::chrono::milliseconds no_timeout = std::chrono::milliseconds(-1);
}

class TimedEventsManager;

/**
 * A callback to run at a given date, once or periodically.
 */

class TimedEvent
{
  friend class TimedEventsManager;
public:
  /**
   * Runs once, at the given time point.
   */
  explicit TimedEvent(std::chrono::steady_clock::time_point&& time_point,
                      std::function<void()> callback, std::string name="");
  /**
   * Runs every `duration`, the first time one `duration` from now.
   */
  explicit TimedEvent(std::chrono::milliseconds&& duration,
                      std::function<void()> callback, std::string name="");

  TimedEvent(TimedEvent&&) = default;
  ~TimedEvent() = default;
  /**
   * Whether or not this event happens after the other one.
   */
  bool is_after(const TimedEvent& other) const;
  bool is_after(const std::chrono::steady_clock::time_point& time_point) const;
  /**
   * Return the duration difference between now and the event time point.
   * If the difference would be negative (i.e. the event is expired), the
   * returned value is 0 instead. The value cannot then be negative.
   */
  std::chrono::milliseconds get_timeout() const;
  void execute() const;
  const std::string& get_name() const;
  bool repeats() const
  {
    return this->repeat;
  }
  std::chrono::milliseconds get_repeat_delay() const
  {
    return this->repeat_delay;
  }

private:
  /**
   * The next time point at which the event is executed.
   */
  std::chrono::steady_clock::time_point time_point;
  /**
   * The function to execute.
   */
  std::function<void()> callback;
  bool repeat;
  /**
   * Period of a repeating event, 0 otherwise.
   */
  std::chrono::milliseconds repeat_delay;
  /**
   * Used to find or cancel the event. Several events can share a name, they
   * are then cancelled together.
   */
  std::string name;

  /**
   * Move a repeating event to its next date, after the given time point.
   */
  void reschedule(const std::chrono::steady_clock::time_point& now);

  TimedEvent(const TimedEvent&) = delete;
  TimedEvent& operator=(const TimedEvent&) = delete;
  TimedEvent& operator=(TimedEvent&&) = delete;
};

/**
 * The list of pending TimedEvents, sorted by date. The main loop waits for
 * get_timeout() and then calls execute_expired_events().
 */

class TimedEventsManager
{
public:
  ~TimedEventsManager() = default;
  static TimedEventsManager& instance();
  void add_event(TimedEvent&& event);
  /**
   * Time left before the next event, 0 if it is already expired, or
   * utils::no_timeout if there is no event at all.
   */
  std::chrono::milliseconds get_timeout() const;
  /**
   * Run all the events whose date has come, and remove them. A repeating
   * event is put back for its next date. If it fell behind by more than
   * one period (a stopped process, a callback slower than the period), it
   * runs only once and its next date is one period from now.
   * Returns the number of executed events.
   */
  std::size_t execute_expired_events();
  /**
   * Returns the number of cancelled events.
   */
  std::size_t cancel(const std::string& name);
  std::size_t size() const;
  /**
   * The first event with that name, or nullptr.
   */
  const TimedEvent* find_event(const std::string& name) const;

private:
  TimedEventsManager() = default;
  std::list<TimedEvent> events;
  TimedEventsManager(const TimedEventsManager&) = delete;
  TimedEventsManager(TimedEventsManager&&) = delete;
  TimedEventsManager& operator=(const TimedEventsManager&) = delete;
  TimedEventsManager& operator=(TimedEventsManager&&) = delete;
};
