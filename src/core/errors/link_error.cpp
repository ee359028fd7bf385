#include "core/errors/link_error.hpp"

namespace camlink::core::errors {

std::string_view ToStableErrorCode(const LinkErrorCode code) {
  switch (code) {
  case LinkErrorCode::kNone:
    return "OK";
  case LinkErrorCode::kMalformedFrame:
    return "MALFORMED_FRAME";
  case LinkErrorCode::kUnknownCommandKind:
    return "UNKNOWN_COMMAND_KIND";
  case LinkErrorCode::kPayloadTooLarge:
    return "PAYLOAD_TOO_LARGE";
  case LinkErrorCode::kCommandInFlight:
    return "COMMAND_IN_FLIGHT";
  case LinkErrorCode::kTimedOut:
    return "TIMED_OUT";
  case LinkErrorCode::kUnknownDevice:
    return "UNKNOWN_DEVICE";
  case LinkErrorCode::kAdapterError:
    return "ADAPTER_ERROR";
  case LinkErrorCode::kTransmitError:
    return "TRANSMIT_ERROR";
  case LinkErrorCode::kInvalidCommand:
    return "INVALID_COMMAND";
  }
  return "UNKNOWN";
}

std::string FormatLinkError(const LinkError& error) {
  std::string text(ToStableErrorCode(error.code));
  if (!error.message.empty()) {
    text += ": ";
    text += error.message;
  }
  return text;
}

} // namespace camlink::core::errors
