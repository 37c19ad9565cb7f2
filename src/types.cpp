#include "pinbank/types.hpp"

namespace pinbank {

const char* to_string(Mode m) { return m == Mode::Input ? "Input" : "Output"; }
const char* to_string(State s) { return s == State::High ? "High" : "Low"; }
const char* to_string(Feature f) { return f == Feature::On ? "On" : "Off"; }

const char* to_string(IntPolarity p) {
  return p == IntPolarity::ActiveHigh ? "Active High" : "Active Low";
}

const char* to_string(Compare c) { return c == Compare::Default ? "Default" : "Previous"; }
const char* to_string(Bank b) { return b == Bank::A ? "A" : "B"; }

std::ostream& operator<<(std::ostream& os, Mode m) { return os << to_string(m); }
std::ostream& operator<<(std::ostream& os, State s) { return os << to_string(s); }
std::ostream& operator<<(std::ostream& os, Feature f) { return os << to_string(f); }
std::ostream& operator<<(std::ostream& os, IntPolarity p) { return os << to_string(p); }
std::ostream& operator<<(std::ostream& os, Compare c) { return os << to_string(c); }
std::ostream& operator<<(std::ostream& os, Bank b) { return os << to_string(b); }

} // namespace pinbank
