#include <roster/identity_interner.hpp>

#include <database/database.hpp>
#include <database/select_query.hpp>
#include <database/insert_query.hpp>
#include <database/errors.hpp>

#include <logger/logger.hpp>

IdentityInterner::IdentityInterner(Database& database):
    database(database)
{
}

std::int64_t IdentityInterner::resolve(const std::string& address)
{
  if (address.empty())
    throw IdentityResolutionFailure("Cannot resolve the identity of an empty address");

  const auto existing = this->find(address);
  if (existing)
    return *existing;

  auto identity = Database::jidmap.row();
  identity.col<Database::Jid>() = address;
  const auto res = insert(identity, this->database.engine());
  if (res == StepResult::Done)
    {
      log_debug("New identity ", identity.col<Database::JidId>(), " for ", address);
      return identity.col<Database::JidId>();
    }

  // Someone else inserted it between our SELECT and our INSERT
  log_debug("Identity of ", address, " created concurrently, reading it again");
  const auto concurrent = this->find(address);
  if (concurrent)
    return *concurrent;
  throw IdentityResolutionFailure("Failed to resolve the identity of " + address);
}

std::optional<std::int64_t> IdentityInterner::find(const std::string& address)
{
  auto request = select(Database::jidmap);
  request.where() << Database::Jid{} << "=" << address;

  const auto result = request.execute(this->database.engine());
  if (result.empty())
    return std::nullopt;
  return result.front().col<Database::JidId>();
}
