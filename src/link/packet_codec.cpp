#include "link/packet_codec.hpp"

#include "link/crc16.hpp"

#include <algorithm>
#include <string>

namespace camlink::link {

namespace {

using core::errors::LinkError;
using core::errors::LinkErrorCode;

constexpr std::uint8_t kRoleMask = 0x01;
constexpr std::uint8_t kReservedMask = 0x0E;
constexpr unsigned kVersionShift = 4;

std::string ToHexByte(std::uint8_t value) {
  constexpr char kDigits[] = "0123456789abcdef";
  std::string text = "0x";
  text.push_back(kDigits[(value >> 4) & 0x0F]);
  text.push_back(kDigits[value & 0x0F]);
  return text;
}

} // namespace

PacketCodec::PacketCodec(const std::size_t max_frame_bytes)
    : max_frame_bytes_(std::max(max_frame_bytes, kOverheadBytes)) {}

std::size_t PacketCodec::MaxPayloadBytes() const {
  return std::min<std::size_t>(0xFF, max_frame_bytes_ - kOverheadBytes);
}

bool PacketCodec::Encode(const Frame& frame, std::vector<std::uint8_t>& out,
                         LinkError& error) const {
  if (frame.payload.size() > MaxPayloadBytes()) {
    error.Set(LinkErrorCode::kPayloadTooLarge,
              "payload of " + std::to_string(frame.payload.size()) + " bytes exceeds limit of " +
                  std::to_string(MaxPayloadBytes()));
    return false;
  }

  std::vector<std::uint8_t> bytes;
  bytes.reserve(kOverheadBytes + frame.payload.size());
  bytes.push_back(frame.destination);
  bytes.push_back(frame.source);
  bytes.push_back(static_cast<std::uint8_t>((kProtocolVersion << kVersionShift) |
                                            static_cast<std::uint8_t>(frame.source_role)));
  bytes.push_back(static_cast<std::uint8_t>(frame.command));
  bytes.push_back(static_cast<std::uint8_t>(frame.sequence >> 8));
  bytes.push_back(static_cast<std::uint8_t>(frame.sequence & 0xFF));
  bytes.push_back(static_cast<std::uint8_t>(frame.payload.size()));
  bytes.insert(bytes.end(), frame.payload.begin(), frame.payload.end());

  const std::uint16_t crc = Crc16CcittFalse(bytes.data(), bytes.size());
  bytes.push_back(static_cast<std::uint8_t>(crc >> 8));
  bytes.push_back(static_cast<std::uint8_t>(crc & 0xFF));

  out = std::move(bytes);
  error.Clear();
  return true;
}

bool PacketCodec::Decode(const std::vector<std::uint8_t>& bytes, Frame& frame,
                         LinkError& error) const {
  if (bytes.size() < kOverheadBytes) {
    error.Set(LinkErrorCode::kMalformedFrame,
              "frame of " + std::to_string(bytes.size()) + " bytes is shorter than header");
    return false;
  }
  if (bytes.size() > max_frame_bytes_) {
    error.Set(LinkErrorCode::kMalformedFrame,
              "frame of " + std::to_string(bytes.size()) + " bytes exceeds transport limit");
    return false;
  }

  const std::size_t declared_payload = bytes[6];
  if (bytes.size() != kOverheadBytes + declared_payload) {
    error.Set(LinkErrorCode::kMalformedFrame,
              "declared payload length " + std::to_string(declared_payload) +
                  " does not match frame size " + std::to_string(bytes.size()));
    return false;
  }

  const std::size_t crc_offset = kHeaderBytes + declared_payload;
  const std::uint16_t expected_crc = Crc16CcittFalse(bytes.data(), crc_offset);
  const std::uint16_t carried_crc =
      static_cast<std::uint16_t>((bytes[crc_offset] << 8) | bytes[crc_offset + 1]);
  if (expected_crc != carried_crc) {
    error.Set(LinkErrorCode::kMalformedFrame, "integrity check failed");
    return false;
  }

  const std::uint8_t flags = bytes[2];
  if ((flags >> kVersionShift) != kProtocolVersion) {
    error.Set(LinkErrorCode::kMalformedFrame,
              "unsupported protocol version " + std::to_string(flags >> kVersionShift));
    return false;
  }
  if ((flags & kReservedMask) != 0U) {
    error.Set(LinkErrorCode::kMalformedFrame, "reserved flag bits set: " + ToHexByte(flags));
    return false;
  }

  const auto command = CommandKindFromByte(bytes[3]);
  if (!command.has_value()) {
    error.Set(LinkErrorCode::kUnknownCommandKind, "command byte " + ToHexByte(bytes[3]));
    return false;
  }

  Frame decoded;
  decoded.destination = bytes[0];
  decoded.source = bytes[1];
  decoded.source_role = (flags & kRoleMask) != 0U ? SourceRole::kController : SourceRole::kRemote;
  decoded.command = command.value();
  decoded.sequence = static_cast<std::uint16_t>((bytes[4] << 8) | bytes[5]);
  decoded.payload.assign(bytes.begin() + static_cast<std::ptrdiff_t>(kHeaderBytes),
                         bytes.begin() + static_cast<std::ptrdiff_t>(crc_offset));

  frame = std::move(decoded);
  error.Clear();
  return true;
}

} // namespace camlink::link
