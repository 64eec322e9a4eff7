#pragma once

#include <cstdint>
#include <string>

/**
 * The presence subscription between a user and one of its contacts, as
 * stored in the low bits of the subscription column.
 */
class Subscription
{
public:
  static constexpr std::int64_t to_bit = 1;
  static constexpr std::int64_t from_bit = 2;
  static constexpr std::int64_t pending_out_bit = 4;
  static constexpr std::int64_t pending_in_bit = 8;
  /**
   * Not a subscription state: set on a stored entry that has been removed
   * but is kept until the retention sweeper purges it.
   */
  static constexpr std::int64_t tombstone_bit = 256;
  static constexpr std::int64_t state_mask = to_bit | from_bit | pending_out_bit | pending_in_bit;

  Subscription() = default;
  explicit Subscription(const std::int64_t bitmask);

  static Subscription none() { return {}; }
  static Subscription to() { return Subscription{to_bit}; }
  static Subscription from() { return Subscription{from_bit}; }
  static Subscription both() { return Subscription{to_bit | from_bit}; }

  /**
   * Build the state from a stored value. The tombstone flag, and any other
   * unknown bit, is ignored.
   */
  static Subscription from_bitmask(const std::int64_t bitmask);
  std::int64_t as_bitmask() const
  {
    return this->bitmask;
  }

  bool has_to() const { return this->bitmask & to_bit; }
  bool has_from() const { return this->bitmask & from_bit; }
  bool pending_out() const { return this->bitmask & pending_out_bit; }
  bool pending_in() const { return this->bitmask & pending_in_bit; }

  void set_to(const bool value) { this->set(to_bit, value); }
  void set_from(const bool value) { this->set(from_bit, value); }
  void set_pending_out(const bool value) { this->set(pending_out_bit, value); }
  void set_pending_in(const bool value) { this->set(pending_in_bit, value); }

  /**
   * The value of the subscription attribute of a roster item: none, to,
   * from or both. Pending states are not part of it.
   */
  std::string to_string() const;

  bool operator==(const Subscription& other) const
  {
    return this->bitmask == other.bitmask;
  }
  bool operator!=(const Subscription& other) const
  {
    return !(*this == other);
  }

private:
  void set(const std::int64_t bit, const bool value);

  std::int64_t bitmask{0};
};

inline bool is_tombstone(const std::int64_t stored_state)
{
  return (stored_state & Subscription::tombstone_bit) != 0;
}
