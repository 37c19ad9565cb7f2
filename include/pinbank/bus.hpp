#pragma once
#include <cstdint>

namespace pinbank {

// Single-byte register access to one device. Implementations throw
// TransportError on failure.
class Bus {
public:
  virtual ~Bus() = default;

  virtual uint8_t read_byte(uint8_t reg) = 0;
  virtual void write_byte(uint8_t reg, uint8_t value) = 0;
};

} // namespace pinbank
