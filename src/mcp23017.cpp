#include "pinbank/mcp23017.hpp"

#include <thread>
#include <utility>

#include "pinbank/bits.hpp"
#include "pinbank/errors.hpp"
#include "pinbank/i2c_bus.hpp"
#include "pinbank/registers.hpp"

namespace pinbank {

MCP23017::MCP23017(std::unique_ptr<Bus> bus, Options options)
  : bus_(std::move(bus)), options_(options) {
  if (!bus_) throw Error("MCP23017: no bus");

  direction_ = bus_->read_byte(REG_IODIRA);
  direction_ |= static_cast<uint16_t>(bus_->read_byte(REG_IODIRB) << 8);

  reset();
}

std::unique_ptr<MCP23017> MCP23017::open(const std::string& i2c_dev, uint8_t i2c_addr,
                                         Options options) {
  auto bus = std::make_unique<I2cBus>(i2c_dev, i2c_addr);
  bus->open();
  return std::make_unique<MCP23017>(std::move(bus), options);
}

uint8_t MCP23017::read_modify_write(uint8_t reg, const Pin& pin, bool value,
                                    std::optional<uint8_t> known_current) {
  uint8_t current = known_current ? *known_current : bus_->read_byte(reg);
  uint8_t updated = set_bit(current, pin.bit(), value);
  bus_->write_byte(reg, updated);
  return updated;
}

uint16_t MCP23017::set_pin_mode(const Pin& pin, Mode mode) {
  uint8_t iodir = read_modify_write(bank_register(REG_IODIRA, pin.bank()), pin, to_bool(mode));
  direction_ = pin.merge_into(direction_, iodir);
  return direction_;
}

uint16_t MCP23017::set_pull_up(const Pin& pin, State state) {
  uint8_t gppu = read_modify_write(bank_register(REG_GPPUA, pin.bank()), pin, to_bool(state));
  return static_cast<uint16_t>(uint16_t(gppu) << pin.shift());
}

uint8_t MCP23017::write_output(const Pin& pin, State state) {
  if (pin.mode(direction_) == Mode::Output) throw WrongModeError(pin);

  // OLAT holds what we last drove; if it can't be read, fall back to GPIO
  std::optional<uint8_t> latch;
  try {
    latch = bus_->read_byte(bank_register(REG_OLATA, pin.bank()));
  } catch (const TransportError&) {
    latch.reset();
  }
  return read_modify_write(bank_register(REG_GPIOA, pin.bank()), pin, to_bool(state), latch);
}

State MCP23017::read_input(const Pin& pin) {
  if (pin.mode(direction_) == Mode::Input) throw WrongModeError(pin);
  return read_current_value(pin);
}

State MCP23017::read_current_value(const Pin& pin) {
  uint8_t gpio = bus_->read_byte(bank_register(REG_GPIOA, pin.bank()));
  return from_bool<State>(test_bit(gpio, pin.bit()));
}

uint8_t MCP23017::read_port(Bank bank) { return bus_->read_byte(bank_register(REG_GPIOA, bank)); }

void MCP23017::write_latch(Bank bank, uint8_t value) {
  bus_->write_byte(bank_register(REG_OLATA, bank), value);
}

void MCP23017::configure_system_interrupt(Feature mirror, State polarity) {
  uint8_t iocon = bus_->read_byte(REG_IOCON);
  iocon = set_bit(iocon, IOCON_MIRROR_BIT, to_bool(mirror));
  iocon = set_bit(iocon, IOCON_INTPOL_BIT, to_bool(polarity));
  bus_->write_byte(REG_IOCON, iocon);
  mirrored_ = mirror;
}

void MCP23017::configure_system_interrupt(Feature mirror, IntPolarity polarity) {
  configure_system_interrupt(mirror, from_bool<State>(to_bool(polarity)));
}

void MCP23017::configure_pin_interrupt(const Pin& pin, Feature enabled, Compare compare_mode,
                                       std::optional<State> default_value) {
  if (pin.mode(direction_) == Mode::Input) throw WrongModeError(pin);

  Bank bank = pin.bank();
  // interrupt-on-change enable
  read_modify_write(bank_register(REG_GPINTENA, bank), pin, to_bool(enabled));
  // compare against DEFVAL or against the previous pin value
  read_modify_write(bank_register(REG_INTCONA, bank), pin, to_bool(compare_mode));
  // DEFVAL is written even in Previous mode so a later switch to Default starts clean
  read_modify_write(bank_register(REG_DEFVALA, bank), pin,
                    to_bool(default_value.value_or(State::Low)));
}

std::optional<InterruptEvent> MCP23017::read_interrupt_register(Bank bank) {
  uint8_t flags = bus_->read_byte(bank_register(REG_INTFA, bank));
  if (flags == 0) return std::nullopt;

  uint8_t bit = highest_bit(flags);
  auto pin = Pin::create(static_cast<uint8_t>(bank == Bank::A ? bit : bit + 8));
  uint8_t captured = bus_->read_byte(bank_register(REG_INTCAPA, bank));
  return InterruptEvent{*pin, from_bool<State>(test_bit(captured, bit))};
}

std::optional<InterruptEvent> MCP23017::read_interrupt(Bank bank) {
  if (mirrored_ == Feature::Off) return read_interrupt_register(bank);

  // Mirrored INT pins don't say which bank fired
  auto event = read_interrupt_register(Bank::A);
  if (event) return event;
  try {
    return read_interrupt_register(Bank::B);
  } catch (const TransportError&) {
    return std::nullopt;
  }
}

void MCP23017::clear_interrupts() {
  auto pending = [this] {
    return bus_->read_byte(REG_INTFA) != 0 && bus_->read_byte(REG_INTFB) != 0;
  };

  if (bus_->read_byte(REG_INTFA) == 0 && bus_->read_byte(REG_INTFB) == 0) return;

  for (unsigned attempt = 0; attempt < options_.clear_retries; attempt++) {
    if (!pending()) return;
    std::this_thread::sleep_for(options_.clear_retry_delay);
  }

  // Stuck: reading GPIO clears INTF/INTCAP
  bus_->read_byte(REG_GPIOA);
  bus_->read_byte(REG_GPIOB);
  throw InterruptsForcedClear();
}

void MCP23017::reset() {
  bus_->write_byte(REG_IODIRA, 0xFF);  // all inputs
  bus_->write_byte(REG_IODIRB, 0xFF);
  bus_->write_byte(REG_GPIOA, 0x00);   // outputs off
  bus_->write_byte(REG_GPIOB, 0x00);
  bus_->write_byte(REG_GPPUA, 0x00);   // pull-ups off
  bus_->write_byte(REG_GPPUB, 0x00);
  bus_->write_byte(REG_IOCON, 0x00);   // chip default configuration
  bus_->write_byte(REG_IOCON_ALIAS, 0x00);
  bus_->write_byte(REG_GPINTENA, 0x00);  // interrupts off
  bus_->write_byte(REG_GPINTENB, 0x00);
  bus_->write_byte(REG_INTCONA, 0x00);   // compare to previous value
  bus_->write_byte(REG_INTCONB, 0x00);
  bus_->write_byte(REG_DEFVALA, 0x00);
  bus_->write_byte(REG_DEFVALB, 0x00);
  // reading GPIO drops any latched interrupt
  bus_->read_byte(REG_GPIOA);
  bus_->read_byte(REG_GPIOB);

  direction_ = 0xFFFF;
  mirrored_ = Feature::Off;
}

} // namespace pinbank
