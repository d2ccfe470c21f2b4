/* @file ErrorMonitor.cpp
 * @brief de-duplicating fault escalation
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <iostream>

// HVLoad headers
#include "core/ErrorMonitor.hpp"

namespace hvload {
  namespace core {

    void ErrorMonitor::registerEscalation(std::function<void(const std::string&)> cb) {
      std::lock_guard<std::mutex> lock(mtx_);
      escalation_ = std::move(cb);
    }

    void ErrorMonitor::notifyFailure(const std::string& message) { forwardIfNew(message); }

    void ErrorMonitor::clear() {
      std::lock_guard<std::mutex> lock(mtx_);
      seen_.clear();
    }

    std::size_t ErrorMonitor::failureCount() const {
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

      std::cerr << "[ErrorMonitor] " << message << "\n";
      // escalate outside the lock, the callback may call back into us
      if (cb)
        cb(message);
    }

  } // namespace core
} // namespace hvload
