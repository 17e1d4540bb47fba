#pragma once
/** @file  ConfigLoader.hpp
 *  @brief Loads backpack bus configuration (JSON) from the host FS.
 *
 *  © 2025 quadseg contributors — MIT-licensed.
 */

#include <cstdint>
#include <string>

namespace quadseg::core {

  /// Where a backpack lives on the bus. Defaults match the Adafruit board.
  struct BackpackConfig {
    static constexpr const char* kDefaultBus = "i2c-1";
    static constexpr std::uint8_t kDefaultAddress = 0x70;
    static constexpr std::uint8_t kMaxAddress = 0x77; ///< A0..A2 jumpers all bridged

    std::string bus{ kDefaultBus };
    std::uint8_t address{ kDefaultAddress };
  };

  /**
 * @class ConfigLoader
 * @brief Thin helper that reads a JSON file and hands back a BackpackConfig.
 *
 *  * No caching, every call to `load()` re-reads the file.
 *  * Keys: "bus" (string), "address" (int or "0x.." string); missing keys keep defaults.
 */
  class ConfigLoader {
  public:
    /// @param configPath  Absolute or relative path on host FS.
    explicit ConfigLoader(std::string configPath);

    /// Parse the file or throw `std::runtime_error`.
    BackpackConfig load() const;

    /// Parse JSON text directly; throws `std::runtime_error` on bad input.
    static BackpackConfig parse(const std::string& text);

  private:
    std::string path_;
  };

} // namespace quadseg::core
