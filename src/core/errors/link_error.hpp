#pragma once

#include <string>
#include <string_view>

namespace camlink::core::errors {

// Stable classification for every recoverable failure on the radio path.
// None of these are fatal; callers log, drop, or surface them as session
// state.
enum class LinkErrorCode {
  kNone,
  kMalformedFrame,
  kUnknownCommandKind,
  kPayloadTooLarge,
  kCommandInFlight,
  kTimedOut,
  kUnknownDevice,
  kAdapterError,
  kTransmitError,
  kInvalidCommand,
};

std::string_view ToStableErrorCode(LinkErrorCode code);

struct LinkError {
  LinkErrorCode code = LinkErrorCode::kNone;
  std::string message;

  void Set(LinkErrorCode new_code, std::string new_message) {
    code = new_code;
    message = std::move(new_message);
  }

  void Clear() {
    code = LinkErrorCode::kNone;
    message.clear();
  }

  bool HasError() const {
    return code != LinkErrorCode::kNone;
  }
};

// "<STABLE_CODE>: <message>", or just the code when the message is empty.
std::string FormatLinkError(const LinkError& error);

} // namespace camlink::core::errors
