#pragma once
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <ostream>
#include <string>

#include "pinbank/types.hpp"

namespace pinbank {

static constexpr uint8_t NUM_GPIO = 16;

// One of the 16 expander pins. 0..7 live in bank A, 8..15 in bank B.
class Pin {
public:
  // nullopt for index >= 16
  static std::optional<Pin> create(uint8_t index);

  uint8_t index() const { return index_; }
  Bank bank() const { return bank_; }
  uint8_t bit() const { return bit_; }                  // bit within the bank's byte
  bool high_half() const { return bank_ == Bank::B; }
  uint8_t shift() const { return high_half() ? 8 : 0; }
  uint8_t mask() const { return static_cast<uint8_t>(1u << bit_); }

  // Mode recorded for this pin in a combined IODIR word (1 = input).
  Mode mode(uint16_t direction) const;

  // Replaces this pin's bank byte inside `word`, keeping the other bank's byte.
  uint16_t merge_into(uint16_t word, uint8_t value) const;

private:
  Pin(uint8_t index, uint8_t bit, Bank bank) : index_(index), bit_(bit), bank_(bank) {}

  uint8_t index_;
  uint8_t bit_;
  Bank bank_;
};

bool operator==(const Pin& a, const Pin& b);
bool operator!=(const Pin& a, const Pin& b);
bool operator<(const Pin& a, const Pin& b);
bool operator>(const Pin& a, const Pin& b);
bool operator<=(const Pin& a, const Pin& b);
bool operator>=(const Pin& a, const Pin& b);

std::string to_string(const Pin& pin);
std::ostream& operator<<(std::ostream& os, const Pin& pin);

} // namespace pinbank

namespace std {
template <> struct hash<pinbank::Pin> {
  size_t operator()(const pinbank::Pin& pin) const noexcept {
    return (static_cast<size_t>(pin.bank()) << 3) | pin.bit();
  }
};
} // namespace std
