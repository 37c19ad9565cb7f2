#include <gtest/gtest.h>

#include <sstream>
#include <unordered_set>

#include "pinbank/bits.hpp"
#include "pinbank/pin.hpp"
#include "pinbank/registers.hpp"

using namespace pinbank;

TEST(Pin, MapsEveryIndexToBankAndBit) {
  for (uint8_t i = 0; i < NUM_GPIO; i++) {
    auto pin = Pin::create(i);
    ASSERT_TRUE(pin.has_value()) << int(i);
    EXPECT_EQ(pin->index(), i);
    EXPECT_EQ(pin->bank(), i < 8 ? Bank::A : Bank::B);
    EXPECT_EQ(pin->bit(), i % 8);
    EXPECT_EQ(pin->high_half(), i >= 8);
    EXPECT_EQ(pin->shift(), i < 8 ? 0 : 8);
    EXPECT_EQ(pin->mask(), 1u << (i % 8));
  }
}

TEST(Pin, RejectsOutOfRangeIndex) {
  EXPECT_FALSE(Pin::create(16).has_value());
  EXPECT_FALSE(Pin::create(17).has_value());
  EXPECT_FALSE(Pin::create(255).has_value());
}

TEST(Pin, ModeFollowsDirectionBit) {
  auto p3 = *Pin::create(3);
  auto p11 = *Pin::create(11);

  EXPECT_EQ(p3.mode(0xFFFF), Mode::Input);
  EXPECT_EQ(p3.mode(0xFFF7), Mode::Output);
  EXPECT_EQ(p11.mode(0x0800), Mode::Input);
  EXPECT_EQ(p11.mode(0xF7FF), Mode::Output);
  // the low byte says nothing about a bank B pin
  EXPECT_EQ(p11.mode(0x00FF), Mode::Output);
}

TEST(Pin, MergeReplacesOnlyItsOwnBank) {
  auto a = *Pin::create(2);
  auto b = *Pin::create(13);

  EXPECT_EQ(a.merge_into(0xABCD, 0x12), 0xAB12);
  EXPECT_EQ(b.merge_into(0xABCD, 0x12), 0x12CD);

  for (uint16_t w : {0x0000, 0x00FF, 0xFF00, 0xA55A, 0xFFFF}) {
    for (unsigned v = 0; v < 256; v++) {
      uint16_t low = a.merge_into(w, static_cast<uint8_t>(v));
      EXPECT_EQ(low & 0xFF, v);
      EXPECT_EQ(low >> 8, w >> 8);

      uint16_t high = b.merge_into(w, static_cast<uint8_t>(v));
      EXPECT_EQ(high >> 8, v);
      EXPECT_EQ(high & 0xFF, w & 0xFF);
    }
  }
}

TEST(Pin, EqualityAndOrderingByBankThenBit) {
  auto a7 = *Pin::create(7);
  auto b0 = *Pin::create(8);
  auto b1 = *Pin::create(9);

  EXPECT_EQ(a7, *Pin::create(7));
  EXPECT_NE(a7, b0);
  EXPECT_LT(a7, b0);
  EXPECT_LT(b0, b1);
  EXPECT_GT(b1, a7);
  EXPECT_LE(b0, b0);
  EXPECT_GE(b1, b0);
}

TEST(Pin, HashesDistinctly) {
  std::unordered_set<Pin> pins;
  for (uint8_t i = 0; i < NUM_GPIO; i++) pins.insert(*Pin::create(i));
  pins.insert(*Pin::create(4));
  EXPECT_EQ(pins.size(), 16u);
}

TEST(Pin, PrintsBitIndexAndBank) {
  EXPECT_EQ(to_string(*Pin::create(3)), "Pin: 3 (3), Bank: A");
  EXPECT_EQ(to_string(*Pin::create(11)), "Pin: 3 (11), Bank: B");
}

TEST(Bits, SetBitTouchesOneBit) {
  EXPECT_EQ(set_bit(0x00, 3, true), 0x08);
  EXPECT_EQ(set_bit(0xFF, 3, false), 0xF7);
  EXPECT_EQ(set_bit(0xA5, 7, false), 0x25);
  EXPECT_EQ(set_bit(0xA5, 1, true), 0xA7);
}

TEST(Bits, SetBitIsIdempotent) {
  for (unsigned byte = 0; byte < 256; byte++) {
    for (uint8_t bit = 0; bit < 8; bit++) {
      auto b = static_cast<uint8_t>(byte);
      uint8_t once = set_bit(b, bit, true);
      EXPECT_EQ(set_bit(once, bit, true), once);
      uint8_t cleared = set_bit(b, bit, false);
      EXPECT_EQ(set_bit(cleared, bit, false), cleared);
    }
  }
}

TEST(Bits, TestAndHighestBit) {
  EXPECT_TRUE(test_bit(0x04, 2));
  EXPECT_FALSE(test_bit(0x04, 3));
  EXPECT_EQ(highest_bit(0x01), 0);
  EXPECT_EQ(highest_bit(0x04), 2);
  EXPECT_EQ(highest_bit(0x05), 2);
  EXPECT_EQ(highest_bit(0x80), 7);
  EXPECT_EQ(highest_bit(0xFF), 7);
}

TEST(Registers, BankPairs) {
  EXPECT_EQ(bank_register(REG_IODIRA, Bank::A), REG_IODIRA);
  EXPECT_EQ(bank_register(REG_IODIRA, Bank::B), REG_IODIRB);
  EXPECT_EQ(bank_register(REG_GPPUA, Bank::B), REG_GPPUB);
  EXPECT_EQ(bank_register(REG_INTFA, Bank::B), REG_INTFB);
  EXPECT_EQ(bank_register(REG_INTCAPA, Bank::B), REG_INTCAPB);
  EXPECT_EQ(bank_register(REG_OLATA, Bank::B), REG_OLATB);
}

TEST(Types, BoolMapping) {
  EXPECT_TRUE(to_bool(Mode::Input));
  EXPECT_TRUE(to_bool(State::High));
  EXPECT_TRUE(to_bool(Feature::On));
  EXPECT_TRUE(to_bool(IntPolarity::ActiveHigh));
  EXPECT_TRUE(to_bool(Compare::Default));
  EXPECT_EQ(from_bool<Mode>(false), Mode::Output);
  EXPECT_EQ(from_bool<State>(false), State::Low);
  EXPECT_EQ(from_bool<Feature>(false), Feature::Off);
  EXPECT_EQ(from_bool<IntPolarity>(false), IntPolarity::ActiveLow);
  EXPECT_EQ(from_bool<Compare>(false), Compare::Previous);
}

TEST(Types, Names) {
  std::ostringstream os;
  os << Mode::Output << ' ' << State::Low << ' ' << Feature::On << ' '
     << IntPolarity::ActiveLow << ' ' << Compare::Previous << ' ' << Bank::B;
  EXPECT_EQ(os.str(), "Output Low On Active Low Previous B");
}
