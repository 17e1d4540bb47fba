/* @file I2CChannel.cpp
 * @brief IO abstraction layer that wraps /dev/i2c-N - handles file descriptor, slave selection and RAII - POSIX compliant
 *
 * © 2025 quadseg contributors — MIT-licensed.
 */

// STL headers
#include <cstddef>
#include <cstring> // for strerror
#include <iostream>

// Linux headers
#include <errno.h> // Error integer and strerror() function
#include <fcntl.h> // Contains file controls like O_RDWR
#include <linux/i2c-dev.h> // I2C_SLAVE
#include <sys/ioctl.h>
#include <unistd.h> // write(), close()

// quadseg headers
#include "io/I2CChannel.hpp"

using namespace quadseg::io;

I2CChannel::~I2CChannel() { close(); }

std::string I2CChannel::devicePath(const std::string& bus) {
  if (!bus.empty() && bus.front() == '/')
    return bus;
  return "/dev/" + bus;
}

bool I2CChannel::open(const std::string& bus) {
  close(); // re-open drops any previous fd

  const std::string path = devicePath(bus);
  fd_ = ::open(path.c_str(), O_RDWR | O_CLOEXEC);
  if (fd_ < 0) {
    std::cerr << "[I2CChannel] Error " << errno << " from open(" << path << "): " << strerror(errno)
              << "\n";
    return false;
  }
  return true;
}

bool I2CChannel::write(std::uint8_t address, const std::vector<std::uint8_t>& bytes) {

  if (fd_ < 0) {
    return false;
  }

  if (selectedAddress_ != address) {
    if (::ioctl(fd_, I2C_SLAVE, static_cast<unsigned long>(address)) < 0) {
      std::cerr << "[I2CChannel] Error " << errno << " from ioctl(I2C_SLAVE, 0x" << std::hex
                << static_cast<int>(address) << std::dec << "): " << strerror(errno) << "\n";
      return false;
    }
    selectedAddress_ = address;
  }

  // i2c-dev turns each write() into one START..STOP message, so a short write is a failure
  for (;;) {
    ssize_t written = ::write(fd_, bytes.data(), bytes.size());
    if (written == static_cast<ssize_t>(bytes.size())) {
      return true;
    } else if (written == -1 && errno == EINTR) {
      continue; // try again
    } else if (written >= 0) {
      std::cerr << "[I2CChannel] short write: " << written << " of " << bytes.size() << " bytes\n";
      return false;
    } else {
      std::cerr << "[I2CChannel] Error " << errno << " from write: " << strerror(errno) << "\n";
      return false;
    }
  }
}

void I2CChannel::close() {
  if (fd_ >= 0)
    ::close(fd_);
  fd_ = -1;
  selectedAddress_ = -1;
}
