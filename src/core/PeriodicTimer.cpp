/* @file PeriodicTimer.cpp
 * @brief condition-variable driven repeating timer
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <exception>

// radflow headers
#include "core/Logger.hpp"
#include "core/PeriodicTimer.hpp"

using namespace radflow::core;

PeriodicTimer::PeriodicTimer(std::string name, std::chrono::milliseconds interval,
                             std::function<void()> tick, Logger& log)
    : name_(std::move(name)), tick_(std::move(tick)), log_(log), interval_(interval) {}

PeriodicTimer::~PeriodicTimer() { stop(); }

void PeriodicTimer::start(std::chrono::milliseconds firstDelay) {
  if (running_.exchange(true))
    return;
  worker_ = std::thread([this, firstDelay] { loop(firstDelay); });
  log_.trace(name_, "timer started (" + std::to_string(interval().count()) + "ms)");
}

void PeriodicTimer::stop() {
  {
    std::lock_guard<std::mutex> lock(mtx_);
    if (!running_.exchange(false))
      return;
  }
  cv_.notify_all();
  if (worker_.joinable())
    worker_.join();
  log_.trace(name_, "timer stopped");
}

void PeriodicTimer::setInterval(std::chrono::milliseconds interval) {
  {
    std::lock_guard<std::mutex> lock(mtx_);
    if (interval == interval_)
      return;
    interval_ = interval;
    rearmed_ = true;
  }
  cv_.notify_all();
  log_.trace(name_, "interval changed to " + std::to_string(interval.count()) + "ms");
}

std::chrono::milliseconds PeriodicTimer::interval() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return interval_;
}

void PeriodicTimer::loop(std::chrono::milliseconds firstDelay) {
  auto next = std::chrono::steady_clock::now() + firstDelay;
  while (true) {
    {
      std::unique_lock<std::mutex> lock(mtx_);
      while (running_ && std::chrono::steady_clock::now() < next) {
        cv_.wait_until(lock, next);
        if (rearmed_) {
          // re-arm relative to now rather than the stale deadline
          rearmed_ = false;
          next = std::chrono::steady_clock::now() + interval_;
        }
      }
      if (!running_)
        return;
    }

    try {
      tick_();
    } catch (const std::exception& e) {
      log_.error(name_, std::string("tick failed: ") + e.what());
    } catch (...) {
      log_.error(name_, "tick failed: unknown exception");
    }

    std::lock_guard<std::mutex> lock(mtx_);
    rearmed_ = false;
    next = std::chrono::steady_clock::now() + interval_;
  }
}
