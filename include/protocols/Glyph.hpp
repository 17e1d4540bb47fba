#pragma once
/** @file  Glyph.hpp
 *  @brief 14-segment glyph table for the HT16K33 alphanumeric backpack.
 *
 *  © 2025 quadseg contributors — MIT-licensed.
 */

// STL headers
#include <array>
#include <cstdint>

namespace quadseg {
  namespace protocols {

    /**
 * @brief One digit cell's segment word as it sits in display RAM.
 *
 *  * [0] = low byte  (A B C D E F G1 G2, bit 0 = A)
 *  * [1] = high byte (H J K L M N DP, bit 6 = DP)
 */
    using Glyph = std::array<std::uint8_t, 2>;

    inline constexpr std::uint8_t kDecimalPointBit = 0x40; ///< DP in the high byte

    /// Segment word for \p c; unsupported characters render blank.
    Glyph glyphFor(char c);

    /// Same glyph with the decimal point lit. Idempotent.
    constexpr Glyph withDecimalPoint(Glyph g) {
      return Glyph{ g[0], static_cast<std::uint8_t>(g[1] | kDecimalPointBit) };
    }

  } // namespace protocols
} // namespace quadseg
