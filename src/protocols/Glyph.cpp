/* @file Glyph.cpp
 * @brief ASCII to 14-segment lookup, one 16-bit word per character code.
 *
 * © 2025 quadseg contributors — MIT-licensed.
 */

// STL headers
#include <cstddef>

// quadseg headers
#include "protocols/Glyph.hpp"

using namespace quadseg::protocols;

namespace {

  constexpr std::size_t kTableSize = 128;

  constexpr std::array<std::uint16_t, kTableSize> buildTable() {
    std::array<std::uint16_t, kTableSize> t{}; // everything blank by default

    // bit 15 -> 0: unused DP N M L K J H G2 G1 F E D C B A
    t['0'] = 0x003F;
    t['1'] = 0x0006;
    t['2'] = 0x00DB;
    t['3'] = 0x00CF;
    t['4'] = 0x00E6;
    t['5'] = 0x00ED;
    t['6'] = 0x00FD;
    t['7'] = 0x0C01; // slanted stroke, not the 7-seg style
    t['8'] = 0x00FF;
    t['9'] = 0x00E7;
    t['%'] = 0x1EE4;

    t['A'] = 0x00F7;
    t['B'] = 0x128F;
    t['C'] = 0x0039;
    t['D'] = 0x120F;
    t['E'] = 0x00F9;
    t['F'] = 0x0071;
    t['G'] = 0x00BD;
    t['H'] = 0x00F6;
    t['I'] = 0x1200;
    t['J'] = 0x001E;
    t['K'] = 0x2470;
    t['L'] = 0x0038;
    t['M'] = 0x0536;
    t['N'] = 0x2136;
    t['O'] = 0x003F;
    t['P'] = 0x00F3;
    t['Q'] = 0x203F;
    t['R'] = 0x20F3;
    t['S'] = 0x018D; // diagonal top half, '5' keeps the box form
    t['T'] = 0x1201;
    t['U'] = 0x003E;
    t['V'] = 0x0C30;
    t['W'] = 0x2836;
    t['X'] = 0x2D00;
    t['Y'] = 0x1500;
    t['Z'] = 0x0C09;

    t['a'] = 0x1058;
    t['b'] = 0x2078;
    t['c'] = 0x00D8;
    t['d'] = 0x088E;
    t['e'] = 0x0858;
    t['f'] = 0x14C0;
    t['g'] = 0x048E;
    t['h'] = 0x1070;
    t['i'] = 0x1000;
    t['j'] = 0x000E;
    t['k'] = 0x3600;
    t['l'] = 0x0030;
    t['m'] = 0x10D4;
    t['n'] = 0x1050;
    t['o'] = 0x00DC;
    t['p'] = 0x0170;
    t['q'] = 0x0486;
    t['r'] = 0x0050;
    t['s'] = 0x2088;
    t['t'] = 0x0078;
    t['u'] = 0x001C;
    t['v'] = 0x2004;
    t['w'] = 0x2814;
    t['x'] = 0x28C0;
    t['y'] = 0x200C;
    t['z'] = 0x0848;

    return t;
  }

  constexpr auto kSegmentTable = buildTable();

  static_assert(kSegmentTable[' '] == 0x0000, "space must stay blank");
  static_assert((kSegmentTable['8'] & 0x4000) == 0, "DP bit is never part of a base glyph");

} // namespace

Glyph quadseg::protocols::glyphFor(char c) {
  const auto code = static_cast<unsigned char>(c);
  if (code >= kTableSize)
    return Glyph{ 0x00, 0x00 }; // non-ASCII byte

  const std::uint16_t word = kSegmentTable[code];
  return Glyph{ static_cast<std::uint8_t>(word & 0xFF), static_cast<std::uint8_t>(word >> 8) };
}
