#include <roster/roster_storage.hpp>

std::vector<std::string> RosterStorage::stream_features(const StreamContext& context) const
{
  std::vector<std::string> features;
  if (this->supports_versioning() && !context.is_server && context.authenticated)
    features.emplace_back(RosterStorage::rosterver_feature);
  return features;
}
