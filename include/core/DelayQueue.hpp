#pragma once
/** @file  DelayQueue.hpp
 *  @brief One-shot deferred jobs (delayed audio cues, reality checks).
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace radflow {
  namespace core {

    class Logger;

    /// Seam for anything that needs "run this later"; tests substitute an immediate runner.
    class Deferrer {
    public:
      virtual ~Deferrer() = default;
      virtual void runAfter(std::chrono::milliseconds delay, std::function<void()> job) = 0;
    };

    /**
 * @class DelayQueue
 * @brief Deadline-ordered jobs run on one background thread.
 *
 *  * Jobs with equal deadlines run in submission order.
 *  * Jobs still pending at `stop()` are discarded.
 */
    class DelayQueue : public Deferrer {
    public:
      explicit DelayQueue(Logger& log);
      ~DelayQueue() override;

      void start();
      void stop();

      void runAfter(std::chrono::milliseconds delay, std::function<void()> job) override;

      std::size_t pending() const;

      DelayQueue(const DelayQueue&) = delete;
      DelayQueue& operator=(const DelayQueue&) = delete;

    private:
      struct Job {
        std::chrono::steady_clock::time_point due;
        std::uint64_t seq;
        std::function<void()> fn;
      };
      struct Later {
        bool operator()(const Job& a, const Job& b) const {
          return a.due != b.due ? a.due > b.due : a.seq > b.seq;
        }
      };

      void loop();

      Logger& log_;
      mutable std::mutex mtx_;
      std::condition_variable cv_;
      std::priority_queue<Job, std::vector<Job>, Later> jobs_;
      std::uint64_t nextSeq_{ 0 };
      bool running_{ false };
      std::thread worker_;
    };

  } // namespace core
} // namespace radflow
