#include "config/config_loader.hpp"

#include "link/camera_status.hpp"
#include "link/packet_codec.hpp"

#include <algorithm>
#include <cstdint>
#include <fstream>
#include <iterator>
#include <limits>
#include <set>

namespace camlink::config {

namespace {

using JsonValue = core::json::Value;

constexpr std::uint64_t kMaxDurationMs = 24ULL * 60ULL * 60ULL * 1000ULL;

void AddIssue(ValidationReport& report, std::string path, std::string message) {
  report.issues.push_back({.path = std::move(path), .message = std::move(message)});
}

std::string JoinPath(std::string_view prefix, std::string_view key) {
  if (prefix.empty()) {
    return std::string(key);
  }
  return std::string(prefix) + "." + std::string(key);
}

// Reads one object level, tracking which keys were consumed so leftovers
// can be reported as unknown.
class FieldReader {
public:
  FieldReader(const JsonValue& object, std::string prefix, ValidationReport& report)
      : object_(object), prefix_(std::move(prefix)), report_(report) {}

  const JsonValue* Take(std::string_view key) {
    consumed_.insert(std::string(key));
    return object_.Find(key);
  }

  std::string PathOf(std::string_view key) const {
    return JoinPath(prefix_, key);
  }

  void ReadDuration(std::string_view key, std::chrono::milliseconds& out, bool allow_zero) {
    const JsonValue* field = Take(key);
    if (field == nullptr) {
      return;
    }
    const auto parsed = field->AsUInt();
    if (!parsed.has_value()) {
      AddIssue(report_, PathOf(key), "must be a non-negative integer (milliseconds)");
      return;
    }
    if (!allow_zero && *parsed == 0U) {
      AddIssue(report_, PathOf(key), "must be greater than 0");
      return;
    }
    if (*parsed > kMaxDurationMs) {
      AddIssue(report_, PathOf(key), "must not exceed 24h (" + std::to_string(kMaxDurationMs) +
                                         " ms)");
      return;
    }
    out = std::chrono::milliseconds(static_cast<std::int64_t>(*parsed));
  }

  template <typename Integer>
  void ReadInteger(std::string_view key, Integer& out, std::uint64_t min_value,
                   std::uint64_t max_value) {
    const JsonValue* field = Take(key);
    if (field == nullptr) {
      return;
    }
    const auto parsed = field->AsUInt();
    if (!parsed.has_value() || *parsed < min_value || *parsed > max_value) {
      AddIssue(report_, PathOf(key), "must be an integer in [" + std::to_string(min_value) +
                                         ", " + std::to_string(max_value) + "]");
      return;
    }
    out = static_cast<Integer>(*parsed);
  }

  void ReadBool(std::string_view key, bool& out) {
    const JsonValue* field = Take(key);
    if (field == nullptr) {
      return;
    }
    const auto parsed = field->AsBool();
    if (!parsed.has_value()) {
      AddIssue(report_, PathOf(key), "must be true or false");
      return;
    }
    out = *parsed;
  }

  void ReportUnknownFields() {
    for (const auto& [key, value] : object_.object_value) {
      if (consumed_.count(key) == 0U) {
        AddIssue(report_, PathOf(key), "is not a recognized field");
      }
    }
  }

private:
  const JsonValue& object_;
  std::string prefix_;
  ValidationReport& report_;
  std::set<std::string> consumed_;
};

void ReadRole(FieldReader& reader, NodeConfig& config, ValidationReport& report) {
  const JsonValue* role = reader.Take("role");
  if (role == nullptr) {
    AddIssue(report, reader.PathOf("role"), "is required; use \"remote\" or \"controller\"");
    return;
  }
  const auto text = role->AsString();
  if (text == "remote") {
    config.role = link::SourceRole::kRemote;
  } else if (text == "controller") {
    config.role = link::SourceRole::kController;
  } else {
    AddIssue(report, reader.PathOf("role"), "must be one of: remote, controller");
  }
}

void ReadDevices(FieldReader& reader, NodeConfig& config, ValidationReport& report) {
  const JsonValue* devices = reader.Take("devices");
  if (devices == nullptr) {
    AddIssue(report, reader.PathOf("devices"), "is required and must list at least one camera id");
    return;
  }
  if (!devices->IsArray()) {
    AddIssue(report, reader.PathOf("devices"), "must be an array of camera ids");
    return;
  }

  config.devices.clear();
  std::set<std::uint64_t> seen;
  for (std::size_t i = 0; i < devices->array_value.size(); ++i) {
    const std::string path = reader.PathOf("devices") + "[" + std::to_string(i) + "]";
    const auto id = devices->array_value[i].AsUInt();
    if (!id.has_value() || *id > 254U) {
      AddIssue(report, path, "must be an integer in [0, 254] (255 is broadcast)");
      continue;
    }
    if (!seen.insert(*id).second) {
      AddIssue(report, path, "duplicates camera id " + std::to_string(*id));
      continue;
    }
    config.devices.push_back(static_cast<link::DeviceId>(*id));
  }
  if (devices->array_value.empty()) {
    AddIssue(report, reader.PathOf("devices"), "must list at least one camera id");
  }
}

void ReadRetry(FieldReader& parent, NodeConfig& config, ValidationReport& report) {
  const JsonValue* retry = parent.Take("retry");
  if (retry == nullptr) {
    return;
  }
  if (!retry->IsObject()) {
    AddIssue(report, parent.PathOf("retry"), "must be an object");
    return;
  }

  FieldReader reader(*retry, parent.PathOf("retry"), report);
  reader.ReadInteger("max_retries", config.retry.max_retries, 0, 16);
  reader.ReadDuration("retry_interval_ms", config.retry.retry_interval, false);
  reader.ReadDuration("max_retry_interval_ms", config.retry.max_retry_interval, false);
  reader.ReadDuration("timeout_ms", config.retry.timeout, false);
  reader.ReadInteger("jitter_percent", config.retry.jitter_percent, 0, 100);

  if (const JsonValue* backoff = reader.Take("backoff"); backoff != nullptr) {
    const auto text = backoff->AsString();
    if (text == "exponential") {
      config.retry.backoff = link::BackoffMode::kExponential;
    } else if (text == "hold") {
      config.retry.backoff = link::BackoffMode::kHold;
    } else {
      AddIssue(report, reader.PathOf("backoff"), "must be one of: exponential, hold");
    }
  }
  reader.ReportUnknownFields();
}

void ReadDedup(FieldReader& parent, NodeConfig& config, ValidationReport& report) {
  const JsonValue* dedup = parent.Take("dedup");
  if (dedup == nullptr) {
    return;
  }
  if (!dedup->IsObject()) {
    AddIssue(report, parent.PathOf("dedup"), "must be an object");
    return;
  }

  FieldReader reader(*dedup, parent.PathOf("dedup"), report);
  reader.ReadInteger("capacity", config.dedup_capacity, 1, 1024);
  reader.ReadDuration("ttl_ms", config.dedup_ttl, false);
  reader.ReportUnknownFields();
}

void CheckCrossFieldRules(const NodeConfig& config, std::string_view prefix,
                          ValidationReport& report) {
  if (config.stale_threshold >= config.offline_threshold) {
    AddIssue(report, JoinPath(prefix, "stale_threshold_ms"),
             "must be less than offline_threshold_ms");
  }
  if (config.heartbeat_interval >= config.offline_threshold) {
    AddIssue(report, JoinPath(prefix, "heartbeat_interval_ms"),
             "must be less than offline_threshold_ms or every peer flaps offline");
  }
  if (config.retry.max_retry_interval < config.retry.retry_interval) {
    AddIssue(report, JoinPath(prefix, "retry.max_retry_interval_ms"),
             "must be at least retry.retry_interval_ms");
  }
  if (config.retry.timeout < config.retry.retry_interval) {
    AddIssue(report, JoinPath(prefix, "retry.timeout_ms"),
             "must be at least retry.retry_interval_ms");
  }
  // A retransmission arriving after its dedup entry expired would run the
  // command a second time.
  if (config.dedup_ttl < config.retry.timeout) {
    AddIssue(report, JoinPath(prefix, "dedup.ttl_ms"),
             "must be at least retry.timeout_ms so retransmissions stay deduplicated");
  }
  if (config.local_id == link::kBroadcastId) {
    AddIssue(report, JoinPath(prefix, "local_id"), "must not be 255 (broadcast)");
  }
  if (std::find(config.devices.begin(), config.devices.end(), config.local_id) !=
          config.devices.end() &&
      config.role == link::SourceRole::kRemote) {
    AddIssue(report, JoinPath(prefix, "local_id"), "must not also be listed in devices");
  }
  if (config.role == link::SourceRole::kController) {
    if (config.remote_id == link::kBroadcastId) {
      AddIssue(report, JoinPath(prefix, "remote_id"), "must not be 255 (broadcast)");
    }
    if (std::find(config.devices.begin(), config.devices.end(), config.remote_id) !=
        config.devices.end()) {
      AddIssue(report, JoinPath(prefix, "remote_id"), "must not also be listed in devices");
    }
  }
}

} // namespace

void ReadNodeConfig(const core::json::Value& root, std::string_view path_prefix,
                    NodeConfig& config, ValidationReport& report) {
  if (!root.IsObject()) {
    AddIssue(report, path_prefix.empty() ? "$" : std::string(path_prefix), "must be an object");
    return;
  }

  FieldReader reader(root, std::string(path_prefix), report);
  ReadRole(reader, config, report);
  reader.ReadInteger("local_id", config.local_id, 0, 255);
  reader.ReadInteger("remote_id", config.remote_id, 0, 255);
  ReadDevices(reader, config, report);

  reader.ReadDuration("heartbeat_interval_ms", config.heartbeat_interval, false);
  reader.ReadDuration("stale_threshold_ms", config.stale_threshold, false);
  reader.ReadDuration("offline_threshold_ms", config.offline_threshold, false);
  ReadRetry(reader, config, report);

  reader.ReadDuration("status_freshness_ms", config.status_freshness, true);
  reader.ReadDuration("status_poll_interval_ms", config.status_poll_interval, false);
  reader.ReadDuration("adapter_timeout_ms", config.adapter_timeout, false);
  reader.ReadInteger("wake_attempts", config.wake_attempts, 1, 10);
  reader.ReadDuration("camera_inactivity_timeout_ms", config.camera_inactivity_timeout, false);
  reader.ReadBool("always_on", config.always_on);
  reader.ReadDuration("auto_sleep_timeout_ms", config.auto_sleep_timeout, false);
  reader.ReadDuration("min_sleep_window_ms", config.min_sleep_window, true);

  // A frame must at least carry a full status payload.
  reader.ReadInteger("max_frame_bytes", config.max_frame_bytes,
                     link::PacketCodec::kOverheadBytes + link::kCameraStatusPayloadBytes,
                     link::PacketCodec::kDefaultMaxFrameBytes);
  ReadDedup(reader, config, report);
  reader.ReadInteger("rx_queue_capacity", config.rx_queue_capacity, 1, 256);
  reader.ReadInteger("initial_sequence", config.initial_sequence, 0,
                     std::numeric_limits<std::uint16_t>::max());
  reader.ReportUnknownFields();

  CheckCrossFieldRules(config, path_prefix, report);
}

bool LoadNodeConfigText(std::string_view json_text, NodeConfig& config, ValidationReport& report,
                        std::string& error) {
  error.clear();
  report = ValidationReport{};

  core::json::Value root;
  std::string parse_error;
  if (!core::json::Parse(json_text, root, parse_error)) {
    AddIssue(report, "$", "invalid JSON: " + parse_error);
    return true;
  }

  NodeConfig parsed;
  ReadNodeConfig(root, "", parsed, report);
  report.valid = report.issues.empty();
  if (report.valid) {
    config = parsed;
  }
  return true;
}

bool LoadNodeConfigFile(const std::string& path, NodeConfig& config, ValidationReport& report,
                        std::string& error) {
  std::ifstream input(path, std::ios::binary);
  if (!input) {
    error = "unable to open config file: " + path;
    return false;
  }
  const std::string text((std::istreambuf_iterator<char>(input)),
                         std::istreambuf_iterator<char>());
  return LoadNodeConfigText(text, config, report, error);
}

std::string FormatValidationIssues(const ValidationReport& report) {
  std::string text;
  for (const auto& issue : report.issues) {
    text += issue.path;
    text += ": ";
    text += issue.message;
    text += '\n';
  }
  return text;
}

} // namespace camlink::config
