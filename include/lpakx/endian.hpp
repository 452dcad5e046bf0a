#pragma once

#include <bit>
#include <cstdint>
#include <cstring>

#include "types.hpp"

namespace lpakx {

// C++20-compatible byteswap (C++23 has std::byteswap)
namespace detail {

inline constexpr uint32_t byteswap(uint32_t value) noexcept {
  return ((value & 0x000000FFu) << 24) | ((value & 0x0000FF00u) << 8) |
         ((value & 0x00FF0000u) >> 8) | ((value & 0xFF000000u) >> 24);
}

} // namespace detail

// Byte order of the host, known at compile time
inline constexpr ByteOrder nativeOrder() noexcept {
  return std::endian::native == std::endian::big ? ByteOrder::Big : ByteOrder::Little;
}

// Convert between the given byte order and host byte order (the operation is symmetric)
inline constexpr uint32_t toHost32(uint32_t value, ByteOrder order) noexcept {
  return order == nativeOrder() ? value : detail::byteswap(value);
}

inline constexpr uint32_t fromHost32(uint32_t value, ByteOrder order) noexcept {
  return toHost32(value, order);
}

// Read an unaligned 32-bit value; caller guarantees 4 readable bytes
inline uint32_t loadU32(const uint8_t *p, ByteOrder order) noexcept {
  uint32_t raw;
  std::memcpy(&raw, p, sizeof(raw));
  return toHost32(raw, order);
}

} // namespace lpakx
