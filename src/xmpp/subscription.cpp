#include <xmpp/subscription.hpp>

Subscription::Subscription(const std::int64_t bitmask):
    bitmask(bitmask & state_mask)
{
}

Subscription Subscription::from_bitmask(const std::int64_t bitmask)
{
  return Subscription{bitmask};
}

std::string Subscription::to_string() const
{
  if (this->has_to() && this->has_from())
    return "both";
  else if (this->has_to())
    return "to";
  else if (this->has_from())
    return "from";
  return "none";
}

void Subscription::set(const std::int64_t bit, const bool value)
{
  if (value)
    this->bitmask |= bit;
  else
    this->bitmask &= ~bit;
}
