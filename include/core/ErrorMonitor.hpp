#pragma once
/** @file  ErrorMonitor.hpp
 *  @brief Central fault aggregator & escalation helper.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <chrono>
#include <functional>
#include <mutex>
#include <string>
#include <unordered_map>

#include "core/Clock.hpp"

namespace radflow::core {

  /**
 * @class ErrorMonitor
 * @brief Other threads call `notifyFailure()`; we call the registered
 *        escalation callback for it unless the same message was escalated
 *        within the debounce window.
 *
 * * Thread-safe (mutex-protected map).
 * * Debounces duplicate failures so the user doesn’t get spammed by a fault
 *   that repeats every poll.
 */
  class ErrorMonitor {
  public:
    explicit ErrorMonitor(std::chrono::milliseconds debounce = std::chrono::seconds{ 2 },
                          const Clock* clock = nullptr);
    virtual ~ErrorMonitor() = default;

    /// Register a lambda that surfaces a fault to the user (toast).
    void registerEscalation(std::function<void(const std::string&)> cb);

    /// Called by subsystems on fault; will forward to the escalation callback.
    virtual void notifyFailure(const std::string& message);

    /// Number of failures reported so far (escalated or debounced).
    std::size_t failureCount() const;

    /// Messages still inside their debounce window.
    std::size_t trackedMessages() const;

  private:
    bool shouldForward(const std::string& message);

    std::function<void(const std::string&)> escalation_{};
    std::unordered_map<std::string, Clock::time_point> seen_; ///< message -> last escalation
    std::chrono::milliseconds debounce_;
    Clock defaultClock_;
    const Clock* clock_;
    std::size_t failures_{ 0 };
    mutable std::mutex mtx_;
  };

} // namespace radflow::core
