#pragma once
#include <cstdint>

#include "pinbank/types.hpp"

namespace pinbank {

// MCP23017 register map, BANK=0 (default). Every B register sits at A + 1.
static constexpr uint8_t REG_IODIRA   = 0x00;
static constexpr uint8_t REG_IODIRB   = 0x01;
static constexpr uint8_t REG_IPOLA    = 0x02;
static constexpr uint8_t REG_IPOLB    = 0x03;
static constexpr uint8_t REG_GPINTENA = 0x04;
static constexpr uint8_t REG_GPINTENB = 0x05;
static constexpr uint8_t REG_DEFVALA  = 0x06;
static constexpr uint8_t REG_DEFVALB  = 0x07;
static constexpr uint8_t REG_INTCONA  = 0x08;
static constexpr uint8_t REG_INTCONB  = 0x09;
static constexpr uint8_t REG_IOCON    = 0x0A;
static constexpr uint8_t REG_IOCON_ALIAS = 0x0B;  // same byte as REG_IOCON
static constexpr uint8_t REG_GPPUA    = 0x0C;
static constexpr uint8_t REG_GPPUB    = 0x0D;
static constexpr uint8_t REG_INTFA    = 0x0E;
static constexpr uint8_t REG_INTFB    = 0x0F;
static constexpr uint8_t REG_INTCAPA  = 0x10;
static constexpr uint8_t REG_INTCAPB  = 0x11;
static constexpr uint8_t REG_GPIOA    = 0x12;
static constexpr uint8_t REG_GPIOB    = 0x13;
static constexpr uint8_t REG_OLATA    = 0x14;
static constexpr uint8_t REG_OLATB    = 0x15;

// IOCON bit positions
static constexpr uint8_t IOCON_MIRROR_BIT = 6;
static constexpr uint8_t IOCON_INTPOL_BIT = 1;

// Picks the A or B register of a pair, given the A register.
constexpr uint8_t bank_register(uint8_t reg_a, Bank bank) {
  return bank == Bank::A ? reg_a : static_cast<uint8_t>(reg_a + 1);
}

} // namespace pinbank
