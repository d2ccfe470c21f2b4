#pragma once
/** @file  ErrorMonitor.hpp
 *  @brief Central fault aggregator & escalation helper.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <cstddef>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

namespace hvload::core {

  /**
 * @class ErrorMonitor
 * @brief Other threads call `notifyFailure()`; we call the registered
 *        escalation callback exactly once per unique error.
 *
 * * Thread-safe (mutex-protected vector).
 * * Debounces duplicate failures so the control surface doesn’t get spammed.
 * * `clear()` forgets the de-dupe list when a new session starts.
 */
  class ErrorMonitor {
  public:
    ErrorMonitor() = default;
    virtual ~ErrorMonitor() = default;

    /// Register a lambda that escalates a fault to the control surface.
    void registerEscalation(std::function<void(const std::string&)> cb);

    /// Called by subsystems on fault; will forward to the escalation callback.
    virtual void notifyFailure(const std::string& message);

    void clear();

    std::size_t failureCount() const;

  private:
    void forwardIfNew(const std::string& message);

    std::function<void(const std::string&)> escalation_{};
    std::vector<std::string> seen_; ///< de-dupe list
    mutable std::mutex mtx_;
  };

} // namespace hvload::core
