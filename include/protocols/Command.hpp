#pragma once
/** @file  Command.hpp
 *  @brief HT16K33 command frames, one bus transaction each.
 *
 *  © 2025 quadseg contributors — MIT-licensed.
 */

// STL headers
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

// quadseg headers
#include "protocols/Glyph.hpp"

namespace quadseg {
  namespace protocols {

    /**
 * @enum BlinkRate
 * @brief Display-setup blink divisor (bits 2:1 of the 0x8_ command).
 */
    enum class BlinkRate : std::uint8_t { Off = 0, Two = 1, One = 2, Half = 3 };

    /// Exact 0.5 / 1.0 / 2.0 Hz match, anything else is Off.
    BlinkRate blinkRateFromHz(double hz);

    const char* toString(BlinkRate rate);

    /**
 * @struct Command
 * @brief Byte frame written to the chip as-is.
 *
 *  * Builders are pure; nothing here touches the bus.
 *  * Builders that take a caller parameter return std::nullopt when it is out of range.
 */
    struct Command {
      static constexpr int kDigitCount = 4;
      static constexpr int kRamBytes = kDigitCount * 2;
      static constexpr int kMaxBrightness = 15;

      std::vector<std::uint8_t> bytes;

      const std::vector<std::uint8_t>& toWire() const { return bytes; }
      std::string toHex() const; ///< "21", "e0 ff", ... for diagnostics

      //---system / display setup------------------------------------------
      static Command oscillator(bool on);
      static Command displaySetup(bool on, BlinkRate rate = BlinkRate::Off);
      static Command blink(BlinkRate rate);
      static std::optional<Command> dimming(int level);

      //---display RAM-----------------------------------------------------
      static std::optional<Command> ramWrite(int position, const std::vector<std::uint8_t>& data);
      static std::optional<Command> writeGlyph(int position, const Glyph& glyph);
      static std::optional<Command> writeText(int position, std::string_view text);
      static Command clear();
      static Command fill();
    };

  } // namespace protocols
} // namespace quadseg
