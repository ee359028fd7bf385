#pragma once

#include "core/errors/link_error.hpp"
#include "link/frame.hpp"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace camlink::link {

// On-air frame layout (multi-byte fields big-endian):
//
//   [0] destination   [1] source   [2] flags   [3] command
//   [4..5] sequence   [6] payload length   [7..7+n) payload
//   [7+n..9+n) CRC16-CCITT-FALSE over everything before it
//
// flags: bit0 source role, bits 4-7 protocol version, bits 1-3 reserved (0).
class PacketCodec {
public:
  static constexpr std::size_t kHeaderBytes = 7;
  static constexpr std::size_t kCrcBytes = 2;
  static constexpr std::size_t kOverheadBytes = kHeaderBytes + kCrcBytes;
  static constexpr std::uint8_t kProtocolVersion = 1;
  // SX126x/SX127x single-packet ceiling.
  static constexpr std::size_t kDefaultMaxFrameBytes = 255;

  explicit PacketCodec(std::size_t max_frame_bytes = kDefaultMaxFrameBytes);

  std::size_t MaxFrameBytes() const {
    return max_frame_bytes_;
  }

  // Largest payload that still fits the transport and the 1-byte length field.
  std::size_t MaxPayloadBytes() const;

  // Fails with kPayloadTooLarge; `out` is untouched on failure.
  bool Encode(const Frame& frame, std::vector<std::uint8_t>& out,
              core::errors::LinkError& error) const;

  // Fails with kMalformedFrame (size/length/CRC/version) or
  // kUnknownCommandKind. The CRC is verified before the command byte is
  // interpreted, so line corruption is always reported as malformed.
  bool Decode(const std::vector<std::uint8_t>& bytes, Frame& frame,
              core::errors::LinkError& error) const;

private:
  std::size_t max_frame_bytes_;
};

} // namespace camlink::link
