#include "pinbank/errors.hpp"
#include "pinbank/mcp23017.hpp"

#include <chrono>
#include <csignal>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>
#include <vector>

using namespace pinbank;

static volatile std::sig_atomic_t g_stop = 0;

static void on_sigint(int) { g_stop = 1; }

static void usage(const char* argv0) {
  std::cerr
    << "Usage: " << argv0 << " [--dev /dev/i2c-X] [--addr 0x20] [--poll-ms 5] <op>...\n"
    << "\nOps (run in order, after the chip is reset):\n"
    << "  mode <pin> in|out\n"
    << "  pullup <pin> on|off\n"
    << "  write <pin> high|low\n"
    << "  read <pin>\n"
    << "  value <pin>\n"
    << "  port a|b\n"
    << "  latch a|b <byte>\n"
    << "  irq-system on|off high|low\n"
    << "  irq <pin> on|off previous|default [high|low]\n"
    << "  clear\n"
    << "  reset\n"
    << "  watch a|b            (until Ctrl+C)\n"
    << "\nDefaults:\n"
    << "  --dev     /dev/i2c-1\n"
    << "  --addr    0x20\n"
    << "  --poll-ms 5\n";
}

// Parse hex like 0x20 or decimal
static long parse_num(const std::string& s, long max, const char* what) {
  char* end = nullptr;
  long v = std::strtol(s.c_str(), &end, 0);
  if (s.empty() || !end || *end != '\0' || v < 0 || v > max) {
    throw std::invalid_argument(std::string("Invalid ") + what + ": " + s);
  }
  return v;
}

static Pin parse_pin(const std::string& s) {
  auto pin = Pin::create(static_cast<uint8_t>(parse_num(s, 0xFF, "pin")));
  if (!pin) throw std::invalid_argument("Pin out of range (0-15): " + s);
  return *pin;
}

static Bank parse_bank(const std::string& s) {
  if (s == "a" || s == "A") return Bank::A;
  if (s == "b" || s == "B") return Bank::B;
  throw std::invalid_argument("Invalid bank: " + s);
}

// Parses one of two spellings, the first meaning `true`.
template <typename E>
static E parse_choice(const std::string& s, const char* yes, const char* no) {
  if (s == yes) return from_bool<E>(true);
  if (s == no) return from_bool<E>(false);
  throw std::invalid_argument("Expected " + std::string(yes) + " or " + no + ", got: " + s);
}

class OpReader {
public:
  explicit OpReader(std::vector<std::string> args) : args_(std::move(args)) {}

  bool done() const { return pos_ >= args_.size(); }
  bool peek_is(const std::string& s) const { return !done() && args_[pos_] == s; }

  const std::string& next(const std::string& op) {
    if (done()) throw std::invalid_argument("Missing argument for '" + op + "'");
    return args_[pos_++];
  }

  bool next_is_choice(const char* a, const char* b) const { return peek_is(a) || peek_is(b); }

private:
  std::vector<std::string> args_;
  size_t pos_ = 0;
};

static void watch(MCP23017& mcp, Bank bank, int poll_ms) {
  std::cout << "Watching bank " << bank << " (mirror " << mcp.mirrored()
            << "). Press Ctrl+C to stop.\n";

  while (!g_stop) {
    auto event = mcp.read_interrupt(bank);
    if (event) {
      std::cout << "Interrupt: " << event->pin << " -> " << event->state << "\n";
      try {
        mcp.clear_interrupts();
      } catch (const InterruptsForcedClear& e) {
        std::cerr << "WARNING: " << e.what() << "\n";
      }
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(poll_ms));
  }
  std::cout << "Stopped.\n";
}

static void run_ops(MCP23017& mcp, OpReader& ops, int poll_ms) {
  std::cout << std::hex;
  while (!ops.done()) {
    std::string op = ops.next("");

    if (op == "mode") {
      Pin pin = parse_pin(ops.next(op));
      Mode mode = parse_choice<Mode>(ops.next(op), "in", "out");
      uint16_t dir = mcp.set_pin_mode(pin, mode);
      std::cout << pin << " mode " << mode << ", IODIR=0x" << dir << "\n";
    } else if (op == "pullup") {
      Pin pin = parse_pin(ops.next(op));
      State state = parse_choice<State>(ops.next(op), "on", "off");
      uint16_t gppu = mcp.set_pull_up(pin, state);
      std::cout << pin << " pull-up " << (state == State::High ? "on" : "off")
                << ", GPPU=0x" << gppu << "\n";
    } else if (op == "write") {
      Pin pin = parse_pin(ops.next(op));
      State state = parse_choice<State>(ops.next(op), "high", "low");
      uint8_t gpio = mcp.write_output(pin, state);
      std::cout << pin << " <- " << state << ", GPIO" << pin.bank() << "=0x" << int(gpio) << "\n";
    } else if (op == "read") {
      Pin pin = parse_pin(ops.next(op));
      std::cout << pin << " -> " << mcp.read_input(pin) << "\n";
    } else if (op == "value") {
      Pin pin = parse_pin(ops.next(op));
      std::cout << pin << " = " << mcp.read_current_value(pin) << "\n";
    } else if (op == "port") {
      Bank bank = parse_bank(ops.next(op));
      std::cout << "GPIO" << bank << "=0x" << int(mcp.read_port(bank)) << "\n";
    } else if (op == "latch") {
      Bank bank = parse_bank(ops.next(op));
      auto value = static_cast<uint8_t>(parse_num(ops.next(op), 0xFF, "byte"));
      mcp.write_latch(bank, value);
      std::cout << "OLAT" << bank << " <- 0x" << int(value) << "\n";
    } else if (op == "irq-system") {
      Feature mirror = parse_choice<Feature>(ops.next(op), "on", "off");
      IntPolarity pol = parse_choice<IntPolarity>(ops.next(op), "high", "low");
      mcp.configure_system_interrupt(mirror, pol);
      std::cout << "Interrupts: mirror " << mirror << ", " << pol << "\n";
    } else if (op == "irq") {
      Pin pin = parse_pin(ops.next(op));
      Feature enabled = parse_choice<Feature>(ops.next(op), "on", "off");
      Compare compare = parse_choice<Compare>(ops.next(op), "default", "previous");
      std::optional<State> defval;
      if (ops.next_is_choice("high", "low")) {
        defval = parse_choice<State>(ops.next(op), "high", "low");
      }
      mcp.configure_pin_interrupt(pin, enabled, compare, defval);
      std::cout << pin << " interrupt " << enabled << ", compare " << compare << "\n";
    } else if (op == "clear") {
      try {
        mcp.clear_interrupts();
        std::cout << "Interrupts clear\n";
      } catch (const InterruptsForcedClear& e) {
        std::cerr << "WARNING: " << e.what() << "\n";
      }
    } else if (op == "reset") {
      mcp.reset();
      std::cout << "Reset\n";
    } else if (op == "watch") {
      Bank bank = parse_bank(ops.next(op));
      std::cout << std::dec;
      watch(mcp, bank, poll_ms);
      std::cout << std::hex;
    } else {
      throw std::invalid_argument("Unknown op: " + op);
    }
  }
  std::cout << std::dec;
}

int main(int argc, char** argv) {
  std::signal(SIGINT, on_sigint);

  std::string dev = "/dev/i2c-1";
  uint8_t addr = 0x20;
  int poll_ms = 5;
  std::vector<std::string> ops;

  try {
    for (int i = 1; i < argc; i++) {
      std::string a = argv[i];
      if (a == "--help" || a == "-h") {
        usage(argv[0]);
        return 0;
      } else if (a == "--dev" && i + 1 < argc) {
        dev = argv[++i];
      } else if (a == "--addr" && i + 1 < argc) {
        addr = static_cast<uint8_t>(parse_num(argv[++i], 0x7F, "address"));
      } else if (a == "--poll-ms" && i + 1 < argc) {
        poll_ms = std::stoi(argv[++i]);
        if (poll_ms < 1) poll_ms = 1;
      } else if (a.rfind("--", 0) == 0) {
        std::cerr << "Unknown arg: " << a << "\n";
        usage(argv[0]);
        return 2;
      } else {
        ops.push_back(a);
      }
    }
  } catch (const std::exception& e) {
    std::cerr << e.what() << "\n";
    usage(argv[0]);
    return 2;
  }

  if (ops.empty()) {
    usage(argv[0]);
    return 2;
  }

  try {
    auto mcp = MCP23017::open(dev, addr);

    std::cout << "MCP23017 ready\n"
              << "  I2C dev : " << dev << "\n"
              << "  Address : 0x" << std::hex << int(addr) << std::dec << "\n";

    OpReader reader(ops);
    run_ops(*mcp, reader, poll_ms);
    return 0;

  } catch (const std::invalid_argument& e) {
    std::cerr << "ERROR: " << e.what() << "\n";
    return 2;
  } catch (const std::exception& e) {
    std::cerr << "ERROR: " << e.what() << "\n";
    return 1;
  }
}
