#pragma once
/** @file  FakeClock.hpp
 *  @brief Manually advanced Clock plus Deferrers that run jobs on demand.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <chrono>
#include <functional>
#include <utility>
#include <vector>

#include "core/Clock.hpp"
#include "core/DelayQueue.hpp"

namespace radflow {
  namespace test {

    class FakeClock : public core::Clock {
    public:
      time_point now() const override { return t_; }
      void advance(std::chrono::milliseconds d) { t_ += d; }

    private:
      time_point t_{ std::chrono::hours{ 1 } };
    };

    /// Runs every job inline, ignoring the delay.
    class ImmediateDeferrer : public core::Deferrer {
    public:
      std::vector<std::chrono::milliseconds> delays;

      void runAfter(std::chrono::milliseconds delay, std::function<void()> job) override {
        delays.push_back(delay);
        job();
      }
    };

    /// Holds jobs until `runAll()`.
    class ManualDeferrer : public core::Deferrer {
    public:
      std::vector<std::pair<std::chrono::milliseconds, std::function<void()>>> jobs;

      void runAfter(std::chrono::milliseconds delay, std::function<void()> job) override {
        jobs.emplace_back(delay, std::move(job));
      }

      void runAll() {
        auto pending = std::move(jobs);
        jobs.clear();
        for (auto& [delay, job] : pending)
          job();
      }
    };

  } // namespace test
} // namespace radflow
