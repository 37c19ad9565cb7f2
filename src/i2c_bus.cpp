#include "pinbank/i2c_bus.hpp"

#include <cerrno>
#include <cstring>
#include <utility>

#include <fcntl.h>
#include <sys/ioctl.h>
#include <unistd.h>

#ifndef I2C_SLAVE
#include <linux/i2c-dev.h>
#endif

#include "pinbank/errors.hpp"

namespace pinbank {

static TransportError sys_err(const std::string& what) {
  return TransportError(what + ": " + std::strerror(errno));
}

I2cBus::I2cBus(std::string i2c_dev, uint8_t i2c_addr)
  : dev_(std::move(i2c_dev)), addr_(i2c_addr) {}

I2cBus::~I2cBus() { close(); }

void I2cBus::open() {
  if (fd_ >= 0) return;

  fd_ = ::open(dev_.c_str(), O_RDWR | O_CLOEXEC);
  if (fd_ < 0) throw sys_err("open(" + dev_ + ")");

  if (::ioctl(fd_, I2C_SLAVE, addr_) < 0) {
    int saved = errno;
    ::close(fd_);
    fd_ = -1;
    errno = saved;
    throw sys_err("ioctl(I2C_SLAVE)");
  }
}

void I2cBus::close() {
  if (fd_ >= 0) {
    ::close(fd_);
    fd_ = -1;
  }
}

void I2cBus::ensure_open() const {
  if (fd_ < 0) throw TransportError("I2cBus: " + dev_ + " is not open");
}

uint8_t I2cBus::read_byte(uint8_t reg) {
  ensure_open();
  // Select the register, then read one byte back
  uint8_t wbuf[1] = { reg };
  if (::write(fd_, wbuf, 1) != 1) throw sys_err("i2c write(reg)");

  uint8_t rbuf[1] = { 0 };
  if (::read(fd_, rbuf, 1) != 1) throw sys_err("i2c read(data)");
  return rbuf[0];
}

void I2cBus::write_byte(uint8_t reg, uint8_t value) {
  ensure_open();
  uint8_t buf[2] = { reg, value };
  if (::write(fd_, buf, 2) != 2) throw sys_err("i2c write(reg,value)");
}

} // namespace pinbank
