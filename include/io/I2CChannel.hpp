#pragma once
/** @file  I2CChannel.hpp
 *  @brief Blocking I²C master write wrapper (uses /dev/i2c-* + ioctl under the hood).
 *
 *  © 2025 quadseg contributors — MIT-licensed.
 */

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace quadseg {
  namespace io {

    /**
 * @class I2CChannel
 * @brief RAII wrapper around a single /dev/i2c-* file descriptor.
 *
 *  * Each write() is one bus transaction to the given 7-bit address.
 *  * Virtual so the driver can be handed a fake bus in tests.
 *  * *Non-copyable*, but move-constructible.
 */
    class I2CChannel {

    public:
      //---ctr / dtr--------------------------------------------
      I2CChannel() = default;
      virtual ~I2CChannel(); // close the /dev/i2c fd at destruction

      //---public API-------------------------------------------
      /** @param bus "i2c-1" style bus code, or an absolute device path. */
      virtual bool open(const std::string& bus);
      virtual bool write(std::uint8_t address, const std::vector<std::uint8_t>& bytes); // false on EIO/NACK
      virtual void close();
      virtual bool isOpen() const { return fd_ >= 0; }

      /// "i2c-1" -> "/dev/i2c-1"; absolute paths pass through.
      static std::string devicePath(const std::string& bus);

      //---non-copyable-----------------------------------------
      I2CChannel(const I2CChannel&) = delete;
      I2CChannel& operator=(const I2CChannel&) = delete;

      //---mv and mv assign-------------------------------------
      I2CChannel(I2CChannel&& other) noexcept
          : fd_(std::exchange(other.fd_, -1)),
            selectedAddress_(std::exchange(other.selectedAddress_, -1)) {}
      I2CChannel& operator=(I2CChannel&& other) noexcept {
        if (this != &other) {
          close();
          fd_ = std::exchange(other.fd_, -1);
          selectedAddress_ = std::exchange(other.selectedAddress_, -1);
        }
        return *this;
      }

    private:
      int fd_{ -1 };              ///< POSIX fd (-1==closed)
      int selectedAddress_{ -1 }; ///< last I2C_SLAVE target, skips redundant ioctl
    };
  } // namespace io
} // namespace quadseg
