#pragma once
#include <cstdint>
#include <ostream>

namespace pinbank {

// Every setting below is one hardware bit. The value that maps to `true`
// is the one written as 1.

enum class Mode : uint8_t { Input, Output };            // IODIR: 1 = input
enum class State : uint8_t { High, Low };               // GPIO/OLAT/DEFVAL: 1 = high
enum class Feature : uint8_t { On, Off };               // GPINTEN, IOCON.MIRROR: 1 = on
enum class IntPolarity : uint8_t { ActiveHigh, ActiveLow };  // IOCON.INTPOL: 1 = active-high
enum class Compare : uint8_t { Default, Previous };     // INTCON: 1 = against DEFVAL
enum class Bank : uint8_t { A, B };

constexpr bool to_bool(Mode m) { return m == Mode::Input; }
constexpr bool to_bool(State s) { return s == State::High; }
constexpr bool to_bool(Feature f) { return f == Feature::On; }
constexpr bool to_bool(IntPolarity p) { return p == IntPolarity::ActiveHigh; }
constexpr bool to_bool(Compare c) { return c == Compare::Default; }

template <typename E> constexpr E from_bool(bool b);

template <> constexpr Mode from_bool<Mode>(bool b) { return b ? Mode::Input : Mode::Output; }
template <> constexpr State from_bool<State>(bool b) { return b ? State::High : State::Low; }
template <> constexpr Feature from_bool<Feature>(bool b) { return b ? Feature::On : Feature::Off; }
template <> constexpr IntPolarity from_bool<IntPolarity>(bool b) {
  return b ? IntPolarity::ActiveHigh : IntPolarity::ActiveLow;
}
template <> constexpr Compare from_bool<Compare>(bool b) {
  return b ? Compare::Default : Compare::Previous;
}

const char* to_string(Mode m);
const char* to_string(State s);
const char* to_string(Feature f);
const char* to_string(IntPolarity p);
const char* to_string(Compare c);
const char* to_string(Bank b);

std::ostream& operator<<(std::ostream& os, Mode m);
std::ostream& operator<<(std::ostream& os, State s);
std::ostream& operator<<(std::ostream& os, Feature f);
std::ostream& operator<<(std::ostream& os, IntPolarity p);
std::ostream& operator<<(std::ostream& os, Compare c);
std::ostream& operator<<(std::ostream& os, Bank b);

} // namespace pinbank
