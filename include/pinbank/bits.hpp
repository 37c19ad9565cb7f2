#pragma once
#include <cstdint>

namespace pinbank {

// Returns `byte` with bit `bit` forced to `value`; the other seven bits are kept.
constexpr uint8_t set_bit(uint8_t byte, uint8_t bit, bool value) {
  return value ? static_cast<uint8_t>(byte | (1u << bit))
               : static_cast<uint8_t>(byte & ~(1u << bit));
}

constexpr bool test_bit(uint8_t byte, uint8_t bit) {
  return (byte & (1u << bit)) != 0;
}

// floor(log2(byte)). Only meaningful for byte != 0.
constexpr uint8_t highest_bit(uint8_t byte) {
  uint8_t bit = 0;
  while (byte >>= 1) bit++;
  return bit;
}

} // namespace pinbank
