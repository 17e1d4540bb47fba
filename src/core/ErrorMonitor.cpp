/* @file ErrorMonitor.cpp
 * @brief de-duplicating fault forwarder.
 *
 * © 2025 quadseg contributors — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <iostream>
#include <utility>

// quadseg headers
#include "core/ErrorMonitor.hpp"

namespace quadseg {
  namespace core {

    void ErrorMonitor::registerEscalation(std::function<void(const std::string&)> cb) {
      std::lock_guard<std::mutex> lock(mtx_);
      escalation_ = std::move(cb);
    }

    void ErrorMonitor::notifyFailure(const std::string& message) {
      std::cerr << message << "\n";
      forwardIfNew(message);
    }

    std::size_t ErrorMonitor::uniqueFailures() const {
      std::lock_guard<std::mutex> lock(mtx_);
      return seen_.size();
    }

    void ErrorMonitor::forwardIfNew(const std::string& message) {
      std::function<void(const std::string&)> cb;
      {
        std::lock_guard<std::mutex> lock(mtx_);
        if (std::find(seen_.begin(), seen_.end(), message) != seen_.end())
          return;
        seen_.push_back(message);
        cb = escalation_;
      }
      // call outside the lock so the callback may notify again
      if (cb)
        cb(message);
    }

  } // namespace core
} // namespace quadseg
