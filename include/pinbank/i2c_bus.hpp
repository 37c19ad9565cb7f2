#pragma once
#include <cstdint>
#include <string>

#include "pinbank/bus.hpp"

namespace pinbank {

// Linux userspace I2C (/dev/i2c-N) bound to one slave address.
class I2cBus : public Bus {
public:
  I2cBus(std::string i2c_dev, uint8_t i2c_addr);
  ~I2cBus() override;

  I2cBus(const I2cBus&) = delete;
  I2cBus& operator=(const I2cBus&) = delete;

  void open();
  void close();
  bool is_open() const { return fd_ >= 0; }

  uint8_t read_byte(uint8_t reg) override;
  void write_byte(uint8_t reg, uint8_t value) override;

  const std::string& device() const { return dev_; }
  uint8_t address() const { return addr_; }

private:
  std::string dev_;
  uint8_t addr_;
  int fd_{-1};

  void ensure_open() const;
};

} // namespace pinbank
