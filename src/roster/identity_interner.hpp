#pragma once

#include <cstdint>
#include <optional>
#include <string>

class Database;

/**
 * Map the bare addresses to the small integer ids used everywhere else in
 * the database (the jidmap table). An id, once given to an address, never
 * changes and is never reused.
 */
class IdentityInterner
{
public:
  explicit IdentityInterner(Database& database);
  ~IdentityInterner() = default;

  IdentityInterner(const IdentityInterner&) = delete;
  IdentityInterner(IdentityInterner&&) = delete;
  IdentityInterner& operator=(const IdentityInterner&) = delete;
  IdentityInterner& operator=(IdentityInterner&&) = delete;

  /**
   * Return the id of the address, creating it if needed.
   *
   * If another connection creates the same address concurrently, its id
   * is returned. Throws an IdentityResolutionFailure for an empty address,
   * or if the id can neither be found nor created.
   */
  std::int64_t resolve(const std::string& address);
  /**
   * Return the id of the address, if it has one.
   */
  std::optional<std::int64_t> find(const std::string& address);

private:
  Database& database;
};
