/* @file ErrorMonitor.cpp
 * @brief fault aggregation with per-message debounce
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

#include "core/ErrorMonitor.hpp"

namespace radflow {
  namespace core {

    ErrorMonitor::ErrorMonitor(std::chrono::milliseconds debounce, const Clock* clock)
        : debounce_(debounce), clock_(clock != nullptr ? clock : &defaultClock_) {}

    void ErrorMonitor::registerEscalation(std::function<void(const std::string&)> cb) {
      std::lock_guard<std::mutex> lock(mtx_);
      escalation_ = std::move(cb);
    }

    void ErrorMonitor::notifyFailure(const std::string& message) {
      std::function<void(const std::string&)> cb;
      {
        std::lock_guard<std::mutex> lock(mtx_);
        ++failures_;
        if (!shouldForward(message))
          return;
        cb = escalation_;
      }
      // escalate outside the lock; the callback may re-enter (toast -> log -> ...)
      if (cb)
        cb(message);
    }

    std::size_t ErrorMonitor::failureCount() const {
      std::lock_guard<std::mutex> lock(mtx_);
      return failures_;
    }

    std::size_t ErrorMonitor::trackedMessages() const {
      std::lock_guard<std::mutex> lock(mtx_);
      return seen_.size();
    }

    bool ErrorMonitor::shouldForward(const std::string& message) {
      const auto now = clock_->now();
      bool debounced = false;
      for (auto it = seen_.begin(); it != seen_.end();) {
        if (now - it->second >= debounce_) {
          it = seen_.erase(it);
        } else {
          if (it->first == message)
            debounced = true;
          ++it;
        }
      }
      if (debounced)
        return false;
      seen_[message] = now;
      return true;
    }

  } // namespace core
} // namespace radflow
