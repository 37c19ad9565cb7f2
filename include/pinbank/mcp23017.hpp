#pragma once
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include "pinbank/bus.hpp"
#include "pinbank/pin.hpp"
#include "pinbank/types.hpp"

namespace pinbank {

struct Options {
  // clear_interrupts(): polls before forcing a clear, and the pause after each
  unsigned clear_retries = 3;
  std::chrono::milliseconds clear_retry_delay{500};
};

struct InterruptEvent {
  Pin pin;
  State state;  // pin value captured in INTCAP when the interrupt latched
};

// MCP23017 16-bit I/O expander.
//
// Keeps a cached copy of IODIR (the direction word) and of IOCON.MIRROR so
// mode checks need no bus traffic. Not thread-safe; guard a shared instance
// with one mutex.
class MCP23017 {
public:
  // Reads IODIRA/IODIRB, then resets the chip.
  explicit MCP23017(std::unique_ptr<Bus> bus, Options options = {});

  // Opens /dev/i2c-N at `i2c_addr` and constructs a device on it.
  static std::unique_ptr<MCP23017> open(const std::string& i2c_dev, uint8_t i2c_addr,
                                        Options options = {});

  MCP23017(const MCP23017&) = delete;
  MCP23017& operator=(const MCP23017&) = delete;

  // Sets one bit of `reg` to `value`. Skips the read when `known_current`
  // already holds the register contents. Returns the byte written.
  uint8_t read_modify_write(uint8_t reg, const Pin& pin, bool value,
                            std::optional<uint8_t> known_current = std::nullopt);

  // Returns the updated direction word.
  uint16_t set_pin_mode(const Pin& pin, Mode mode);

  // Returns the pin's GPPU byte shifted into its bank position. Only that
  // bank's half is filled in.
  uint16_t set_pull_up(const Pin& pin, State state);

  // Throws WrongModeError if the cached direction says Output.
  uint8_t write_output(const Pin& pin, State state);

  // Throws WrongModeError if the cached direction says Input.
  State read_input(const Pin& pin);

  // GPIO value regardless of mode.
  State read_current_value(const Pin& pin);

  uint8_t read_port(Bank bank);
  void write_latch(Bank bank, uint8_t value);

  void configure_system_interrupt(Feature mirror, State polarity);
  void configure_system_interrupt(Feature mirror, IntPolarity polarity);

  // Throws WrongModeError if the cached direction says Input.
  void configure_pin_interrupt(const Pin& pin, Feature enabled, Compare compare_mode,
                               std::optional<State> default_value = std::nullopt);

  // Highest flagged pin of `bank` and its captured value, or nullopt when
  // INTF is clear. Lower flagged pins are not reported.
  std::optional<InterruptEvent> read_interrupt_register(Bank bank);

  // Call when INTA/INTB fires. With mirroring on, both banks are checked
  // (A first) and `bank` is ignored.
  std::optional<InterruptEvent> read_interrupt(Bank bank);

  // Waits for pending interrupt flags to drop. Throws InterruptsForcedClear
  // if they never do and GPIO had to be read to clear them.
  void clear_interrupts();

  // All pins input, outputs low, pull-ups and interrupts off, IOCON cleared.
  void reset();

  uint16_t direction() const { return direction_; }
  Feature mirrored() const { return mirrored_; }
  const Options& options() const { return options_; }

private:
  std::unique_ptr<Bus> bus_;
  Options options_;
  uint16_t direction_{0xFFFF};
  Feature mirrored_{Feature::Off};
};

} // namespace pinbank
