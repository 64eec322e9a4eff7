#pragma once

#include <xmpp/subscription.hpp>

#include <algorithm>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

/**
 * One contact of a user's roster, as read from or written to the store.
 */
class RosterItem
{
public:
  RosterItem(const std::string& jid, const std::optional<std::string>& name,
             const std::vector<std::string>& groups);
  RosterItem(const std::string& jid, const std::optional<std::string>& name);
  explicit RosterItem(const std::string& jid);
  RosterItem() = default;
  ~RosterItem() = default;
  RosterItem(const RosterItem&) = default;
  RosterItem(RosterItem&&) = default;
  RosterItem& operator=(const RosterItem&) = default;
  RosterItem& operator=(RosterItem&&) = default;

  /**
   * Add the group if the item is not already in it.
   */
  void add_group(const std::string& group);
  bool in_group(const std::string& group) const;

  std::string jid;
  std::optional<std::string> name;
  Subscription subscription;
  std::vector<std::string> groups;
  /**
   * The contact has been removed from the roster. The item is still
   * returned until it gets purged, so that clients know about the removal.
   */
  bool remove{false};
  /**
   * Number of the last journal entry concerning this contact. 0 if it has
   * never changed since versioning exists.
   */
  std::int64_t version{0};
};

/**
 * An ordered list of roster items.
 */
class Roster
{
public:
  Roster() = default;
  ~Roster() = default;
  Roster(const Roster&) = default;
  Roster(Roster&&) = default;
  Roster& operator=(const Roster&) = default;
  Roster& operator=(Roster&&) = default;

  void clear();

  template <typename... ArgsType>
  RosterItem* add_item(ArgsType&&... args)
  {
    this->items.emplace_back(std::forward<ArgsType>(args)...);
    auto it = this->items.end() - 1;
    return &*it;
  }
  RosterItem* get_item(const std::string& jid)
  {
    auto it = std::find_if(this->items.begin(), this->items.end(),
                           [&jid](const auto& item)
                           {
                             return item.jid == jid;
                           });
    if (it != this->items.end())
      return &*it;
    return nullptr;
  }
  const std::vector<RosterItem>& get_items() const
  {
    return this->items;
  }
  std::size_t size() const
  {
    return this->items.size();
  }
  bool empty() const
  {
    return this->items.empty();
  }
  /**
   * The highest version among the items, 0 for an empty roster.
   */
  std::int64_t version() const;

private:
  std::vector<RosterItem> items;
};
