#pragma once

#include <string>
#include <string_view>

namespace camlink::camera {

// Failure classes of the short-range camera link.
enum class AdapterErrorCode {
  kNone,
  kNotConnected,
  kNoResponse,
  kTimeout,
  kCancelled,
  kRejected,
};

struct AdapterError {
  AdapterErrorCode code = AdapterErrorCode::kNone;
  std::string message;

  void Set(AdapterErrorCode new_code, std::string new_message) {
    code = new_code;
    message = std::move(new_message);
  }

  void Clear() {
    code = AdapterErrorCode::kNone;
    message.clear();
  }
};

std::string_view ToStableErrorCode(AdapterErrorCode code);

// Operator-facing hint for a failed `operation` ("wake", "set_recording",
// "query_status", "power_down").
std::string BuildActionableMessage(AdapterErrorCode code, std::string_view operation);

// "<STABLE_CODE>: <actionable message> detail: <raw message>"; the detail
// suffix is omitted when the raw message is empty.
std::string FormatAdapterError(std::string_view operation, const AdapterError& error);

} // namespace camlink::camera
