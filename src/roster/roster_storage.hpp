#pragma once

#include <xmpp/roster.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

/**
 * What a storage needs to know about a stream to decide which features
 * it advertises on it.
 */
struct StreamContext
{
  /** A server-to-server stream */
  bool is_server{false};
  /** The SASL authentication of the peer succeeded */
  bool authenticated{false};
};

/**
 * Interface of the persistent rosters used by the server.
 */
class RosterStorage
{
public:
  static constexpr auto rosterver_feature = "urn:xmpp:features:rosterver";

  RosterStorage() = default;
  virtual ~RosterStorage() = default;

  RosterStorage(const RosterStorage&) = delete;
  RosterStorage(RosterStorage&&) = delete;
  RosterStorage& operator=(const RosterStorage&) = delete;
  RosterStorage& operator=(RosterStorage&&) = delete;

  /**
   * The whole roster of the owner, removed items included.
   */
  virtual Roster load(const std::string& owner) = 0;
  virtual std::optional<RosterItem> load_one(const std::string& owner, const std::string& contact) = 0;
  /**
   * The items of the roster that changed after the given version.
   */
  virtual Roster load_since(const std::string& owner, const std::int64_t version) = 0;
  virtual std::int64_t current_version(const std::string& owner) = 0;
  /**
   * Create or change the roster item. If respect_subscription is false,
   * the subscription state of an existing item is not changed, and the
   * returned item carries the stored one.
   */
  virtual RosterItem upsert(const std::string& owner, const RosterItem& item,
                            const bool respect_subscription) = 0;
  virtual void remove(const std::string& owner, const std::string& contact) = 0;
  virtual void wipe(const std::string& owner) = 0;
  virtual bool supports_versioning() const
  {
    return false;
  }

  /**
   * A roster set sent by the client itself.
   */
  RosterItem set_item(const std::string& owner, const RosterItem& item)
  {
    return this->upsert(owner, item, true);
  }

  /**
   * The namespaces of the stream features to advertise on that stream
   * (RFC 6121 2.6.1).
   */
  std::vector<std::string> stream_features(const StreamContext& context) const;
};
