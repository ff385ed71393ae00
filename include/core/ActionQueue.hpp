#pragma once
/** @file  ActionQueue.hpp
 *  @brief FIFO of ActionRequests drained by one worker thread.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>

#include "core/ActionRequest.hpp"

namespace radflow {
  namespace core {

    class ErrorMonitor;
    class Logger;

    /**
 * @class ActionQueue
 * @brief Serialized execution of user/device/internal actions.
 *
 *  * `enqueue()` never blocks on an executing action.
 *  * Exactly one action runs at a time, in enqueue order.
 *  * `prepare` and `cleanup` wrap every action; `cleanup` runs even when the
 *    action throws. A throwing action is logged and reported to the
 *    ErrorMonitor; the loop keeps going.
 *  * `tryLockIdle()` is the execution gate: it only succeeds between actions,
 *    and while it is held the worker does not start the next one.
 */
    class ActionQueue {
    public:
      struct Handlers {
        std::function<void(const ActionRequest&)> prepare;
        std::function<void(const ActionRequest&)> execute;
        std::function<void(const ActionRequest&)> cleanup;
      };

      ActionQueue(Handlers handlers, ErrorMonitor& errors, Logger& log,
                  std::chrono::milliseconds idleWake = std::chrono::milliseconds{ 500 });
      ~ActionQueue();

      /// Runs on the worker after every wake, before the queue is drained.
      void setIdleHook(std::function<void()> hook);

      void enqueue(ActionRequest request);

      void start();

      /// Stops taking new actions and waits up to \p timeout for the in-flight
      /// one. Returns false when the worker had to be waited on past the timeout.
      bool stop(std::chrono::milliseconds timeout);

      /// Executes everything queued on the calling thread. Only for hosts that
      /// never started the worker; throws std::logic_error otherwise.
      std::size_t drain();

      bool busy() const { return busy_; }
      bool running() const { return running_; }
      std::size_t pending() const;

      [[nodiscard]] std::unique_lock<std::mutex> tryLockIdle();

      ActionQueue(const ActionQueue&) = delete;
      ActionQueue& operator=(const ActionQueue&) = delete;

    private:
      void loop();
      bool runNext(); ///< false when the queue was empty
      void runOne(const ActionRequest& request);

      Handlers handlers_;
      ErrorMonitor& errors_;
      Logger& log_;
      std::chrono::milliseconds idleWake_;
      std::function<void()> idleHook_;

      mutable std::mutex mtx_; ///< guards queue_ and exited_
      std::condition_variable cv_;
      std::deque<ActionRequest> queue_;
      bool exited_{ true };

      std::mutex execMtx_; ///< held for the full duration of one action
      std::atomic<bool> busy_{ false };
      std::atomic<bool> running_{ false };
      std::thread worker_;
    };

  } // namespace core
} // namespace radflow
