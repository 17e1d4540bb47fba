// quadseg headers
#include "protocols/Command.hpp"
#include "protocols/Glyph.hpp"

// GTest headers
#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <map>
#include <string>

using namespace quadseg::protocols;
using ::testing::ElementsAre;
using ::testing::ElementsAreArray;

using Bytes = std::vector<std::uint8_t>;

//---Glyph table------------------------------------------------------------

TEST(glyph_table, space_with_decimal_point) {
  EXPECT_EQ(withDecimalPoint(glyphFor(' ')), (Glyph{ 0x00, 0x40 }));
}

TEST(glyph_table, digits_match_backpack_encoding) {
  EXPECT_EQ(glyphFor('0'), (Glyph{ 0b00111111, 0b00000000 }));
  EXPECT_EQ(glyphFor('1'), (Glyph{ 0b00000110, 0b00000000 }));
  EXPECT_EQ(glyphFor('2'), (Glyph{ 0b11011011, 0b00000000 }));
  EXPECT_EQ(glyphFor('3'), (Glyph{ 0b11001111, 0b00000000 }));
  EXPECT_EQ(glyphFor('4'), (Glyph{ 0b11100110, 0b00000000 }));
  EXPECT_EQ(glyphFor('5'), (Glyph{ 0b11101101, 0b00000000 }));
  EXPECT_EQ(glyphFor('6'), (Glyph{ 0b11111101, 0b00000000 }));
  EXPECT_EQ(glyphFor('7'), (Glyph{ 0b00000001, 0b00001100 }));
  EXPECT_EQ(glyphFor('8'), (Glyph{ 0b11111111, 0b00000000 }));
  EXPECT_EQ(glyphFor('9'), (Glyph{ 0b11100111, 0b00000000 }));
}

TEST(glyph_table, symbols_and_letters) {
  EXPECT_EQ(glyphFor('%'), (Glyph{ 0b11100100, 0b00011110 }));
  EXPECT_EQ(glyphFor('C'), (Glyph{ 0b00111001, 0b00000000 }));
  EXPECT_EQ(glyphFor('E'), (Glyph{ 0b11111001, 0b00000000 }));
  EXPECT_EQ(glyphFor('H'), (Glyph{ 0b11110110, 0b00000000 }));
  EXPECT_EQ(glyphFor('T'), (Glyph{ 0b00000001, 0b00010010 }));
  EXPECT_EQ(glyphFor('A'), (Glyph{ 0xF7, 0x00 }));
  EXPECT_EQ(glyphFor('B'), (Glyph{ 0x8F, 0x12 }));
  EXPECT_EQ(glyphFor('Z'), (Glyph{ 0x09, 0x0C }));
}

// every supported character and its 16-bit segment word
const std::map<char, std::uint16_t> kExpectedTable = {
  { ' ', 0x0000 }, { '%', 0x1EE4 },
  { '0', 0x003F }, { '1', 0x0006 }, { '2', 0x00DB }, { '3', 0x00CF }, { '4', 0x00E6 },
  { '5', 0x00ED }, { '6', 0x00FD }, { '7', 0x0C01 }, { '8', 0x00FF }, { '9', 0x00E7 },
  { 'A', 0x00F7 }, { 'B', 0x128F }, { 'C', 0x0039 }, { 'D', 0x120F }, { 'E', 0x00F9 },
  { 'F', 0x0071 }, { 'G', 0x00BD }, { 'H', 0x00F6 }, { 'I', 0x1200 }, { 'J', 0x001E },
  { 'K', 0x2470 }, { 'L', 0x0038 }, { 'M', 0x0536 }, { 'N', 0x2136 }, { 'O', 0x003F },
  { 'P', 0x00F3 }, { 'Q', 0x203F }, { 'R', 0x20F3 }, { 'S', 0x018D }, { 'T', 0x1201 },
  { 'U', 0x003E }, { 'V', 0x0C30 }, { 'W', 0x2836 }, { 'X', 0x2D00 }, { 'Y', 0x1500 },
  { 'Z', 0x0C09 },
  { 'a', 0x1058 }, { 'b', 0x2078 }, { 'c', 0x00D8 }, { 'd', 0x088E }, { 'e', 0x0858 },
  { 'f', 0x14C0 }, { 'g', 0x048E }, { 'h', 0x1070 }, { 'i', 0x1000 }, { 'j', 0x000E },
  { 'k', 0x3600 }, { 'l', 0x0030 }, { 'm', 0x10D4 }, { 'n', 0x1050 }, { 'o', 0x00DC },
  { 'p', 0x0170 }, { 'q', 0x0486 }, { 'r', 0x0050 }, { 's', 0x2088 }, { 't', 0x0078 },
  { 'u', 0x001C }, { 'v', 0x2004 }, { 'w', 0x2814 }, { 'x', 0x28C0 }, { 'y', 0x200C },
  { 'z', 0x0848 },
};

TEST(glyph_table, whole_ascii_range_matches_expected_table) {
  for (int code = 0; code < 128; ++code) {
    const char c = static_cast<char>(code);
    const auto it = kExpectedTable.find(c);
    const std::uint16_t word = it == kExpectedTable.end() ? 0x0000 : it->second;
    EXPECT_EQ(glyphFor(c), (Glyph{ static_cast<std::uint8_t>(word & 0xFF),
                                   static_cast<std::uint8_t>(word >> 8) }))
        << "code " << code;
  }
}

TEST(glyph_table, zero_and_letter_o_are_the_only_shared_glyph) {
  std::map<Glyph, std::string> owners;
  for (const auto& [c, word] : kExpectedTable) {
    const Glyph g = glyphFor(c);
    EXPECT_EQ(g[1] & kDecimalPointBit, 0) << c;
    if (c != ' ')
      EXPECT_NE(g, (Glyph{ 0, 0 })) << c;
    owners[g] += c;
  }
  for (const auto& [g, chars] : owners) {
    if (chars.size() > 1)
      EXPECT_EQ(chars, "0O");
  }
  EXPECT_EQ(owners.size(), kExpectedTable.size() - 1);
  EXPECT_NE(glyphFor('5'), glyphFor('S'));
  EXPECT_NE(glyphFor('F'), glyphFor('f'));
}

TEST(glyph_table, unsupported_characters_are_blank) {
  for (char c : { '#', '!', '\0', '\n', '~', '@' })
    EXPECT_EQ(glyphFor(c), (Glyph{ 0x00, 0x00 })) << static_cast<int>(c);
  EXPECT_EQ(glyphFor(static_cast<char>(0xC3)), (Glyph{ 0x00, 0x00 }));
  EXPECT_EQ(glyphFor(static_cast<char>(0xFF)), (Glyph{ 0x00, 0x00 }));
}

TEST(glyph_table, decimal_point_only_touches_high_byte_and_is_idempotent) {
  for (int hi : { 0x00, 0x12, 0x40, 0xBF, 0xFF }) {
    const Glyph g{ 0xA5, static_cast<std::uint8_t>(hi) };
    const Glyph once = withDecimalPoint(g);
    EXPECT_EQ(once[0], 0xA5);
    EXPECT_EQ(once[1], static_cast<std::uint8_t>(hi | 0x40));
    EXPECT_EQ(withDecimalPoint(once), once);
  }
}

//---Command encoding---------------------------------------------------------

TEST(command_encoding, oscillator) {
  EXPECT_THAT(Command::oscillator(true).toWire(), ElementsAre(0x21));
  EXPECT_THAT(Command::oscillator(false).toWire(), ElementsAre(0x20));
}

TEST(command_encoding, display_setup_power) {
  EXPECT_THAT(Command::displaySetup(true).toWire(), ElementsAre(0x81));
  EXPECT_THAT(Command::displaySetup(false).toWire(), ElementsAre(0x80));
}

TEST(command_encoding, blink_rates) {
  EXPECT_THAT(Command::blink(BlinkRate::Half).toWire(), ElementsAre(0x87));
  EXPECT_THAT(Command::blink(BlinkRate::One).toWire(), ElementsAre(0x85));
  EXPECT_THAT(Command::blink(BlinkRate::Two).toWire(), ElementsAre(0x83));
  EXPECT_THAT(Command::blink(BlinkRate::Off).toWire(), ElementsAre(0x81));
}

TEST(command_encoding, blink_rate_from_hz_needs_exact_match) {
  EXPECT_EQ(blinkRateFromHz(0.5), BlinkRate::Half);
  EXPECT_EQ(blinkRateFromHz(1.0), BlinkRate::One);
  EXPECT_EQ(blinkRateFromHz(2.0), BlinkRate::Two);
  EXPECT_EQ(blinkRateFromHz(3.0), BlinkRate::Off);
  EXPECT_EQ(blinkRateFromHz(0.0), BlinkRate::Off);
  EXPECT_EQ(blinkRateFromHz(0.49), BlinkRate::Off);
  EXPECT_STREQ(toString(BlinkRate::Half), "0.5Hz");
}

TEST(command_encoding, dimming_range) {
  EXPECT_THAT(Command::dimming(0)->toWire(), ElementsAre(0xE0));
  EXPECT_THAT(Command::dimming(15)->toWire(), ElementsAre(0xEF));
  EXPECT_FALSE(Command::dimming(16).has_value());
  EXPECT_FALSE(Command::dimming(-1).has_value());
}

TEST(command_encoding, glyph_write_addresses_cell_by_position) {
  const Glyph g{ 0x12, 0x34 };
  for (int pos = 0; pos < 4; ++pos)
    EXPECT_THAT(Command::writeGlyph(pos, g)->toWire(),
                ElementsAre(static_cast<std::uint8_t>(pos * 2), 0x12, 0x34));

  for (int pos : { -1, 4, 5, 100 })
    EXPECT_FALSE(Command::writeGlyph(pos, g).has_value()) << pos;
}

TEST(command_encoding, text_write_renders_left_to_right) {
  const Glyph a = glyphFor('A');
  const Glyph b = glyphFor('B');
  EXPECT_THAT(Command::writeText(1, "AB")->toWire(), ElementsAre(0x02, a[0], a[1], b[0], b[1]));
  EXPECT_EQ(Command::writeText(0, "HEAT")->toWire().size(), 9u);
}

TEST(command_encoding, text_write_must_fit_four_cells) {
  EXPECT_FALSE(Command::writeText(3, "AB").has_value());
  EXPECT_FALSE(Command::writeText(0, "HELLO").has_value());
  EXPECT_FALSE(Command::writeText(-1, "A").has_value());
  EXPECT_TRUE(Command::writeText(2, "AB").has_value());
}

TEST(command_encoding, empty_text_still_sends_the_address_byte) {
  EXPECT_THAT(Command::writeText(0, "")->toWire(), ElementsAre(0x00));
  EXPECT_THAT(Command::writeText(4, "")->toWire(), ElementsAre(0x08));
  EXPECT_FALSE(Command::writeText(5, "").has_value());
  EXPECT_FALSE(Command::writeGlyph(4, Glyph{ 0x01, 0x00 }).has_value());
}

TEST(command_encoding, clear_and_fill) {
  EXPECT_THAT(Command::clear().toWire(), ElementsAreArray(Bytes(9, 0x00)));

  Bytes fill(9, 0xFF);
  fill[0] = 0x00;
  EXPECT_THAT(Command::fill().toWire(), ElementsAreArray(fill));
}

TEST(command_encoding, hex_dump) {
  EXPECT_EQ(Command::oscillator(true).toHex(), "21");
  EXPECT_EQ(Command::writeGlyph(1, Glyph{ 0xAB, 0x0C })->toHex(), "02 ab 0c");
}
