#include <xmpp/roster.hpp>

RosterItem::RosterItem(const std::string& jid, const std::optional<std::string>& name,
                       const std::vector<std::string>& groups):
  jid(jid),
  name(name),
  groups(groups)
{
}

RosterItem::RosterItem(const std::string& jid, const std::optional<std::string>& name):
  jid(jid),
  name(name),
  groups{}
{
}

RosterItem::RosterItem(const std::string& jid):
  jid(jid)
{
}

void RosterItem::add_group(const std::string& group)
{
  if (!this->in_group(group))
    this->groups.push_back(group);
}

bool RosterItem::in_group(const std::string& group) const
{
  return std::find(this->groups.begin(), this->groups.end(), group) != this->groups.end();
}

void Roster::clear()
{
  this->items.clear();
}

std::int64_t Roster::version() const
{
  std::int64_t res = 0;
  for (const auto& item: this->items)
    res = std::max(res, item.version);
  return res;
}
