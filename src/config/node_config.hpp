#pragma once

#include "link/frame.hpp"
#include "link/retransmission_engine.hpp"
#include "session/command_executor.hpp"
#include "session/device_session.hpp"
#include "session/session_registry.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace camlink::config {

// Tunables of one radio node. Field defaults are the shipped firmware
// defaults; every duration is in milliseconds in the JSON form.
struct NodeConfig {
  link::SourceRole role = link::SourceRole::kRemote;
  link::DeviceId local_id = 0;
  // Controller only: where heartbeats and status replies go.
  link::DeviceId remote_id = 0;
  std::vector<link::DeviceId> devices;

  std::chrono::milliseconds heartbeat_interval{5'000};
  std::chrono::milliseconds stale_threshold{10'000};
  std::chrono::milliseconds offline_threshold{16'000};

  link::RetryPolicy retry{.max_retries = 3,
                          .retry_interval = std::chrono::milliseconds(800),
                          .backoff = link::BackoffMode::kExponential,
                          .max_retry_interval = std::chrono::milliseconds(6'400),
                          .timeout = std::chrono::milliseconds(15'000),
                          .jitter_percent = 10};

  std::chrono::milliseconds status_freshness{2'000};
  std::chrono::milliseconds status_poll_interval{5'000};
  std::chrono::milliseconds adapter_timeout{3'000};
  std::uint32_t wake_attempts = 2;
  std::chrono::milliseconds camera_inactivity_timeout{300'000};
  bool always_on = false;
  std::chrono::milliseconds auto_sleep_timeout{300'000};
  std::chrono::milliseconds min_sleep_window{200};

  std::size_t max_frame_bytes = 255;
  std::size_t dedup_capacity = 32;
  std::chrono::milliseconds dedup_ttl{60'000};
  std::size_t rx_queue_capacity = 16;
  std::uint16_t initial_sequence = 0;
};

std::string_view RoleName(link::SourceRole role);

// Projections consumed by the session layer.
session::SessionSettings ToSessionSettings(const NodeConfig& config);
session::RegistrySettings ToRegistrySettings(const NodeConfig& config);
session::ExecutorSettings ToExecutorSettings(const NodeConfig& config, core::TimePoint origin);

} // namespace camlink::config
