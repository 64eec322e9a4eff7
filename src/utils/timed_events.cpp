#include <utils/timed_events.hpp>

#include <algorithm>
#include <utility>

TimedEvent::TimedEvent(std::chrono::steady_clock::time_point&& time_point,
                       std::function<void()> callback, std::string name):
  time_point(std::move(time_point)),
  callback(std::move(callback)),
  repeat(false),
  repeat_delay(0),
  name(std::move(name))
{
}

TimedEvent::TimedEvent(std::chrono::milliseconds&& duration,
                       std::function<void()> callback, std::string name):
  time_point(std::chrono::steady_clock::now() + duration),
  callback(std::move(callback)),
  repeat(true),
  repeat_delay(std::move(duration)),
  name(std::move(name))
{
}

bool TimedEvent::is_after(const TimedEvent& other) const
{
  return this->is_after(other.time_point);
}

bool TimedEvent::is_after(const std::chrono::steady_clock::time_point& time_point) const
{
  return this->time_point > time_point;
}

std::chrono::milliseconds TimedEvent::get_timeout() const
{
  const auto diff = std::chrono::duration_cast<std::chrono::milliseconds>(this->time_point - std::chrono::steady_clock::now());
  return std::max(diff, 0ms);
}

void TimedEvent::execute() const
{
  this->callback();
}

const std::string& TimedEvent::get_name() const
{
  return this->name;
}

void TimedEvent::reschedule(const std::chrono::steady_clock::time_point& now)
{
  this->time_point += this->repeat_delay;
  if (!this->is_after(now))
    this->time_point = now + this->repeat_delay;
}

TimedEventsManager& TimedEventsManager::instance()
{
  static TimedEventsManager inst;
  return inst;
}

void TimedEventsManager::add_event(TimedEvent&& event)
{
  const auto it = std::find_if(this->events.begin(), this->events.end(),
                               [&event](const TimedEvent& other)
                               {
                                 return other.is_after(event);
                               });
  this->events.emplace(it, std::move(event));
}

std::chrono::milliseconds TimedEventsManager::get_timeout() const
{
  if (this->events.empty())
    return utils::no_timeout;
  return this->events.front().get_timeout() + 1ms;
}

std::size_t TimedEventsManager::execute_expired_events()
{
  std::size_t count = 0;
  const auto now = std::chrono::steady_clock::now();
  while (!this->events.empty() && !this->events.front().is_after(now))
    {
      TimedEvent event(std::move(this->events.front()));
      this->events.pop_front();
      ++count;
      event.execute();
      if (event.repeat)
        {
          event.reschedule(std::chrono::steady_clock::now());
          this->add_event(std::move(event));
        }
    }
  return count;
}

std::size_t TimedEventsManager::cancel(const std::string& name)
{
  const auto before = this->events.size();
  this->events.remove_if([&name](const TimedEvent& event)
                         {
                           return event.get_name() == name;
                         });
  return before - this->events.size();
}

std::size_t TimedEventsManager::size() const
{
  return this->events.size();
}

const TimedEvent* TimedEventsManager::find_event(const std::string& name) const
{
  const auto it = std::find_if(this->events.begin(), this->events.end(),
                               [&name](const TimedEvent& event)
                               {
                                 return event.get_name() == name;
                               });
  if (it == this->events.end())
    return nullptr;
  return &*it;
}
