#include "config/node_config.hpp"

namespace camlink::config {

std::string_view RoleName(const link::SourceRole role) {
  return role == link::SourceRole::kRemote ? "remote" : "controller";
}

session::SessionSettings ToSessionSettings(const NodeConfig& config) {
  return session::SessionSettings{.stale_threshold = config.stale_threshold,
                                  .offline_threshold = config.offline_threshold,
                                  .dedup_capacity = config.dedup_capacity,
                                  .dedup_ttl = config.dedup_ttl};
}

session::RegistrySettings ToRegistrySettings(const NodeConfig& config) {
  session::RegistrySettings settings;
  settings.role = config.role;
  settings.local_id = config.local_id;
  settings.devices = config.devices;
  settings.session = ToSessionSettings(config);
  settings.retry = config.retry;
  return settings;
}

session::ExecutorSettings ToExecutorSettings(const NodeConfig& config,
                                             const core::TimePoint origin) {
  return session::ExecutorSettings{.adapter_timeout = config.adapter_timeout,
                                   .status_freshness = config.status_freshness,
                                   .wake_attempts = config.wake_attempts,
                                   .clock_origin = origin};
}

} // namespace camlink::config
