/* @file Command.cpp
 * @brief HT16K33 command byte encoding (system setup, display setup, dimming, RAM writes).
 *
 * © 2025 quadseg contributors — MIT-licensed.
 */

// STL headers
#include <cstddef>
#include <cstdio>

// quadseg headers
#include "protocols/Command.hpp"

using namespace quadseg::protocols;

namespace {
  constexpr std::uint8_t kSystemSetup = 0x20;  ///< | 1 = oscillator on
  constexpr std::uint8_t kDisplaySetup = 0x80; ///< | blink << 1 | on
  constexpr std::uint8_t kDimmingSet = 0xE0;   ///< | level (0..15)
} // namespace

BlinkRate quadseg::protocols::blinkRateFromHz(double hz) {
  // compared exactly, the chip has no in-between rates
  if (hz == 0.5)
    return BlinkRate::Half;
  if (hz == 1.0)
    return BlinkRate::One;
  if (hz == 2.0)
    return BlinkRate::Two;
  return BlinkRate::Off;
}

const char* quadseg::protocols::toString(BlinkRate rate) {
  switch (rate) {
  case BlinkRate::Off:
    return "off";
  case BlinkRate::Two:
    return "2Hz";
  case BlinkRate::One:
    return "1Hz";
  case BlinkRate::Half:
    return "0.5Hz";
  default:
    return "unknown";
  }
}

std::string Command::toHex() const {
  std::string out;
  char buf[4];
  for (auto b : bytes) {
    if (!out.empty())
      out += ' ';
    std::snprintf(buf, sizeof(buf), "%02x", b);
    out += buf;
  }
  return out;
}

Command Command::oscillator(bool on) {
  return Command{ { static_cast<std::uint8_t>(kSystemSetup | (on ? 0x01 : 0x00)) } };
}

Command Command::displaySetup(bool on, BlinkRate rate) {
  const auto blinkBits = static_cast<std::uint8_t>(static_cast<std::uint8_t>(rate) << 1);
  return Command{ { static_cast<std::uint8_t>(kDisplaySetup | blinkBits | (on ? 0x01 : 0x00)) } };
}

Command Command::blink(BlinkRate rate) { return displaySetup(true, rate); }

std::optional<Command> Command::dimming(int level) {
  if (level < 0 || level > kMaxBrightness)
    return std::nullopt;
  return Command{ { static_cast<std::uint8_t>(kDimmingSet | level) } };
}

std::optional<Command> Command::ramWrite(int position, const std::vector<std::uint8_t>& data) {
  if (position < 0 || position > kDigitCount)
    return std::nullopt; // position == kDigitCount only fits an empty payload

  const auto offset = static_cast<std::size_t>(position) * 2;
  if (offset + data.size() > static_cast<std::size_t>(kRamBytes))
    return std::nullopt; // would run past the last digit cell

  Command cmd;
  cmd.bytes.reserve(1 + data.size());
  cmd.bytes.push_back(static_cast<std::uint8_t>(offset));
  cmd.bytes.insert(cmd.bytes.end(), data.begin(), data.end());
  return cmd;
}

std::optional<Command> Command::writeGlyph(int position, const Glyph& glyph) {
  if (position >= kDigitCount)
    return std::nullopt;
  return ramWrite(position, { glyph[0], glyph[1] });
}

std::optional<Command> Command::writeText(int position, std::string_view text) {
  if (text.size() > static_cast<std::size_t>(kDigitCount))
    return std::nullopt;

  std::vector<std::uint8_t> data;
  data.reserve(text.size() * 2);
  for (char c : text) {
    const Glyph g = glyphFor(c);
    data.push_back(g[0]);
    data.push_back(g[1]);
  }
  return ramWrite(position, data);
}

Command Command::clear() { return *ramWrite(0, std::vector<std::uint8_t>(kRamBytes, 0x00)); }

Command Command::fill() { return *ramWrite(0, std::vector<std::uint8_t>(kRamBytes, 0xFF)); }
