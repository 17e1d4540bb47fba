/* @file Backpack.cpp
 * @brief drives one HT16K33 backpack: lifecycle, parameter checks, one bus write per call
 *
 * © 2025 quadseg contributors — MIT-licensed.
 */

// STL headers
#include <iostream>
#include <stdexcept>
#include <utility>

// quadseg headers
#include "core/Backpack.hpp"

using namespace quadseg::core;
using quadseg::protocols::BlinkRate;
using quadseg::protocols::Command;
using quadseg::protocols::Glyph;

Backpack::Backpack(std::shared_ptr<ErrorMonitor> errMonitor, std::unique_ptr<io::I2CChannel> channel)
    : errorMonitor_(std::move(errMonitor)), channel_(std::move(channel)) {
  if (!errorMonitor_)
    throw std::invalid_argument("[Backpack] error monitor is nullptr");
  if (!channel_)
    throw std::invalid_argument("[Backpack] channel is nullptr");
}

Backpack::~Backpack() {
  if (!open_)
    return;
  try {
    deinit();
  } catch (const std::exception& e) {
    std::cerr << "[Backpack] deinit during destruction failed: " << e.what() << "\n";
  }
}

Backpack::Backpack(Backpack&& other) noexcept
    : errorMonitor_(std::move(other.errorMonitor_)), channel_(std::move(other.channel_)),
      address_(other.address_), open_(std::exchange(other.open_, false)) {}

Backpack& Backpack::operator=(Backpack&& other) {
  if (this != &other) {
    deinit(); // release our own chip first
    errorMonitor_ = std::move(other.errorMonitor_);
    channel_ = std::move(other.channel_);
    address_ = other.address_;
    open_ = std::exchange(other.open_, false);
  }
  return *this;
}

void Backpack::init(const std::string& bus, std::uint8_t address) {
  if (open_)
    throw std::logic_error("[Backpack] init on an already open backpack");
  if (!channel_)
    throw std::logic_error("[Backpack] init on a moved-from backpack");
  if (address > BackpackConfig::kMaxAddress)
    throw std::invalid_argument("[Backpack] address out of range 0x00-0x77: " +
                                std::to_string(address));

  if (!channel_->open(bus))
    fail("[Backpack] i2c bus: " + bus + " open failed");

  address_ = address;
  if (!channel_->write(address_, Command::oscillator(true).toWire())) {
    channel_->close();
    fail("[Backpack] oscillator on failed at address " + std::to_string(address_));
  }
  open_ = true;
}

void Backpack::init(const BackpackConfig& config) { init(config.bus, config.address); }

void Backpack::deinit() {
  if (!open_)
    return;

  const bool sent = channel_->write(address_, Command::oscillator(false).toWire());
  channel_->close();
  open_ = false;

  if (!sent)
    fail("[Backpack] oscillator off failed at address " + std::to_string(address_));
}

Backpack& Backpack::power(bool on) {
  send(Command::displaySetup(on), "power");
  return *this;
}

Backpack& Backpack::clear() {
  send(Command::clear(), "clear");
  return *this;
}

Backpack& Backpack::fill() {
  send(Command::fill(), "fill");
  return *this;
}

Backpack& Backpack::blink(BlinkRate rate) {
  send(Command::blink(rate), "blink");
  return *this;
}

Backpack& Backpack::blink(double hz) { return blink(protocols::blinkRateFromHz(hz)); }

Backpack& Backpack::radiate(int brightness) {
  requireOpen("radiate");
  auto cmd = Command::dimming(brightness);
  if (!cmd) {
    std::cerr << "[Backpack] radiate: brightness " << brightness << " outside [0,16), ignored\n";
    return *this;
  }
  send(*cmd, "radiate");
  return *this;
}

Backpack& Backpack::writeCharTo(int position, const Glyph& glyph) {
  requireOpen("writeCharTo");
  auto cmd = Command::writeGlyph(position, glyph);
  if (!cmd) {
    std::cerr << "[Backpack] writeCharTo: position " << position << " outside [0,4), ignored\n";
    return *this;
  }
  send(*cmd, "writeCharTo");
  return *this;
}

Backpack& Backpack::writeStringTo(int position, std::string_view text) {
  requireOpen("writeStringTo");
  auto cmd = Command::writeText(position, text);
  if (!cmd) {
    std::cerr << "[Backpack] writeStringTo: \"" << text << "\" at position " << position
              << " does not fit 4 cells, ignored\n";
    return *this;
  }
  send(*cmd, "writeStringTo");
  return *this;
}

void Backpack::send(const Command& cmd, const char* what) {
  requireOpen(what);
  if (!channel_->write(address_, cmd.toWire())) {
    std::cerr << "[Backpack] " << what << " frame: " << cmd.toHex() << "\n";
    // fault text carries no payload: one dead bus is one unique fault
    fail(std::string("[Backpack] ") + what + " write failed at address " + std::to_string(address_));
  }
}

void Backpack::requireOpen(const char* what) const {
  if (!open_)
    throw std::logic_error(std::string("[Backpack] ") + what + " on a closed backpack");
}

void Backpack::fail(const std::string& msg) {
  errorMonitor_->notifyFailure(msg);
  throw std::runtime_error(msg);
}
