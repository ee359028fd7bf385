#include "camera/adapter_error.hpp"

namespace camlink::camera {

std::string_view ToStableErrorCode(const AdapterErrorCode code) {
  switch (code) {
  case AdapterErrorCode::kNone:
    return "CAMERA_OK";
  case AdapterErrorCode::kNotConnected:
    return "CAMERA_NOT_CONNECTED";
  case AdapterErrorCode::kNoResponse:
    return "CAMERA_NO_RESPONSE";
  case AdapterErrorCode::kTimeout:
    return "CAMERA_TIMEOUT";
  case AdapterErrorCode::kCancelled:
    return "CAMERA_CALL_CANCELLED";
  case AdapterErrorCode::kRejected:
    return "CAMERA_REJECTED";
  }
  return "CAMERA_UNKNOWN";
}

std::string BuildActionableMessage(const AdapterErrorCode code, std::string_view operation) {
  const std::string label = operation.empty() ? "camera operation" : std::string(operation);

  switch (code) {
  case AdapterErrorCode::kNone:
    return label + " succeeded";
  case AdapterErrorCode::kNotConnected:
    return "Camera is not connected during " + label +
           "; check that it is paired and within short-range distance.";
  case AdapterErrorCode::kNoResponse:
    return "Camera did not answer during " + label +
           "; it may be powered off or its battery may be flat.";
  case AdapterErrorCode::kTimeout:
    return "Camera exceeded the call budget during " + label +
           "; raise adapter_timeout_ms or move the controller closer.";
  case AdapterErrorCode::kCancelled:
    return label + " was cancelled before the camera answered.";
  case AdapterErrorCode::kRejected:
    return "Camera rejected " + label + "; it may be busy or in an incompatible mode.";
  }
  return label + " failed";
}

std::string FormatAdapterError(std::string_view operation, const AdapterError& error) {
  std::string text(ToStableErrorCode(error.code));
  text += ": ";
  text += BuildActionableMessage(error.code, operation);
  if (!error.message.empty()) {
    text += " detail: ";
    text += error.message;
  }
  return text;
}

} // namespace camlink::camera
