#ifndef CAMLINK_LINK_CRC16_HPP_
#define CAMLINK_LINK_CRC16_HPP_

#include <cstddef>
#include <cstdint>

namespace camlink::link {

// CRC16-CCITT-FALSE (poly 0x1021, init 0xFFFF, no reflection, no xorout).
// Check value for "123456789" is 0x29B1.
inline std::uint16_t Crc16CcittFalse(const std::uint8_t* data, std::size_t len) {
  std::uint16_t crc = 0xFFFF;
  for (std::size_t i = 0; i < len; ++i) {
    crc = static_cast<std::uint16_t>(crc ^ (static_cast<std::uint16_t>(data[i]) << 8));
    for (int bit = 0; bit < 8; ++bit) {
      if ((crc & 0x8000U) != 0U) {
        crc = static_cast<std::uint16_t>((crc << 1) ^ 0x1021U);
      } else {
        crc = static_cast<std::uint16_t>(crc << 1);
      }
    }
  }
  return crc;
}

} // namespace camlink::link

#endif // CAMLINK_LINK_CRC16_HPP_
