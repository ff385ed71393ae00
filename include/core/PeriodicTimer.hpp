#pragma once
/** @file  PeriodicTimer.hpp
 *  @brief Named, re-armable repeating timer on its own thread.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

namespace radflow {
  namespace core {

    class Logger;

    /**
 * @class PeriodicTimer
 * @brief Calls `tick` every `interval` until stopped.
 *
 *  * `setInterval()` may be called from inside `tick`; the new period applies
 *    from the end of the current tick.
 *  * `stop()` lets a running tick finish and then stops re-arming.
 *  * A tick that throws is logged; the timer keeps running.
 */
    class PeriodicTimer {
    public:
      PeriodicTimer(std::string name, std::chrono::milliseconds interval, std::function<void()> tick,
                    Logger& log);
      ~PeriodicTimer();

      void start(std::chrono::milliseconds firstDelay = std::chrono::milliseconds{ 0 });
      void stop();

      void setInterval(std::chrono::milliseconds interval);
      std::chrono::milliseconds interval() const;

      bool running() const { return running_; }

      PeriodicTimer(const PeriodicTimer&) = delete;
      PeriodicTimer& operator=(const PeriodicTimer&) = delete;

    private:
      void loop(std::chrono::milliseconds firstDelay);

      std::string name_;
      std::function<void()> tick_;
      Logger& log_;

      mutable std::mutex mtx_;
      std::condition_variable cv_;
      std::chrono::milliseconds interval_;
      bool rearmed_{ false };
      std::atomic<bool> running_{ false };
      std::thread worker_;
    };

  } // namespace core
} // namespace radflow
