#pragma once
/** @file  Backpack.hpp
 *  @brief Connection handle for one HT16K33 14-segment backpack.
 *
 *  © 2025 quadseg contributors — MIT-licensed.
 */

// STL headers
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

// quadseg headers
#include "core/ConfigLoader.hpp" // BackpackConfig
#include "core/ErrorMonitor.hpp" // Backpack reports bus faults to the error monitor
#include "io/I2CChannel.hpp"     // Backpack owns its channel and requires full type knowledge
#include "protocols/Command.hpp"
#include "protocols/Glyph.hpp"

namespace quadseg {
  namespace core {

    /**
 * @class Backpack
 * @brief Owns the bus channel to one chip and turns display calls into command frames.
 *
 *  * Two states: closed (constructed / after deinit) and open (after init).
 *  * Every display call is exactly one blocking bus write, no buffering, no retries.
 *  * Out-of-range position / brightness / text length is ignored (no write) and logged.
 *  * Display calls on a closed handle throw std::logic_error.
 *  * Bus failures go to the ErrorMonitor, then throw std::runtime_error.
 */
    class Backpack {
    public:
      explicit Backpack(std::shared_ptr<ErrorMonitor> errMonitor,
                        std::unique_ptr<io::I2CChannel> channel = std::make_unique<io::I2CChannel>());
      ~Backpack(); ///< deinit() if still open

      //---lifecycle--------------------------------------------------------
      void init(const std::string& bus = BackpackConfig::kDefaultBus,
                std::uint8_t address = BackpackConfig::kDefaultAddress);
      void init(const BackpackConfig& config);
      void deinit(); ///< oscillator off, then release the channel

      //---display commands-------------------------------------------------
      Backpack& power(bool on = true);
      Backpack& clear();
      Backpack& fill();
      Backpack& blink(protocols::BlinkRate rate);
      Backpack& blink(double hz); ///< 0.5 / 1.0 / 2.0, anything else stops blinking
      Backpack& radiate(int brightness);
      Backpack& writeCharTo(int position, const protocols::Glyph& glyph);
      Backpack& writeStringTo(int position, std::string_view text);

      bool isOpen() const { return open_; }
      std::uint8_t address() const { return address_; }

      //---non-copyable, move-enabled---------------------------------------
      Backpack(const Backpack&) = delete;
      Backpack& operator=(const Backpack&) = delete;
      Backpack(Backpack&& other) noexcept;
      Backpack& operator=(Backpack&& other);

    private:
      void send(const protocols::Command& cmd, const char* what);
      void requireOpen(const char* what) const;
      [[noreturn]] void fail(const std::string& msg);

      std::shared_ptr<ErrorMonitor> errorMonitor_;
      std::unique_ptr<io::I2CChannel> channel_;
      std::uint8_t address_{ BackpackConfig::kDefaultAddress };
      bool open_{ false };
    };

  } // namespace core
} // namespace quadseg
