#pragma once
#include <stdexcept>
#include <string>

#include "pinbank/pin.hpp"

namespace pinbank {

class Error : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// A bus open, read or write failed.
class TransportError : public Error {
public:
  using Error::Error;
};

// The cached pin direction does not allow the requested operation.
class WrongModeError : public Error {
public:
  explicit WrongModeError(const Pin& pin);

  const Pin& pin() const noexcept { return pin_; }

private:
  Pin pin_;
};

// clear_interrupts() gave up waiting and cleared the flags by reading GPIO.
class InterruptsForcedClear : public Error {
public:
  InterruptsForcedClear();
};

} // namespace pinbank
