#include "pinbank/errors.hpp"

namespace pinbank {

WrongModeError::WrongModeError(const Pin& pin)
  : Error("wrong pin mode for operation on " + to_string(pin)), pin_(pin) {}

InterruptsForcedClear::InterruptsForcedClear()
  : Error("interrupt flags stuck, cleared by reading GPIOA/GPIOB") {}

} // namespace pinbank
