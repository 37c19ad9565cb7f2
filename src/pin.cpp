#include "pinbank/pin.hpp"

#include <sstream>
#include <tuple>

namespace pinbank {

std::optional<Pin> Pin::create(uint8_t index) {
  if (index >= NUM_GPIO) return std::nullopt;
  if (index < 8) return Pin(index, index, Bank::A);
  return Pin(index, static_cast<uint8_t>(index - 8), Bank::B);
}

Mode Pin::mode(uint16_t direction) const {
  return from_bool<Mode>((direction & (1u << index_)) != 0);
}

uint16_t Pin::merge_into(uint16_t word, uint8_t value) const {
  if (high_half()) {
    return static_cast<uint16_t>((word & 0x00FF) | (uint16_t(value) << 8));
  }
  return static_cast<uint16_t>((word & 0xFF00) | value);
}

bool operator==(const Pin& a, const Pin& b) {
  return a.bank() == b.bank() && a.bit() == b.bit();
}

bool operator!=(const Pin& a, const Pin& b) { return !(a == b); }

bool operator<(const Pin& a, const Pin& b) {
  return std::make_tuple(a.bank(), a.bit()) < std::make_tuple(b.bank(), b.bit());
}

bool operator>(const Pin& a, const Pin& b) { return b < a; }
bool operator<=(const Pin& a, const Pin& b) { return !(b < a); }
bool operator>=(const Pin& a, const Pin& b) { return !(a < b); }

std::string to_string(const Pin& pin) {
  std::ostringstream os;
  os << pin;
  return os.str();
}

std::ostream& operator<<(std::ostream& os, const Pin& pin) {
  return os << "Pin: " << int(pin.bit()) << " (" << int(pin.index()) << "), Bank: " << pin.bank();
}

} // namespace pinbank
