/* @file ActionQueue.cpp
 * @brief single worker action loop with prepare/cleanup wrapping
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <exception>
#include <stdexcept>
#include <string>

// radflow headers
#include "core/ActionQueue.hpp"
#include "core/ErrorMonitor.hpp"
#include "core/Logger.hpp"

using namespace radflow::core;

namespace {
  constexpr std::string_view kComponent = "ActionQueue";
}

ActionQueue::ActionQueue(Handlers handlers, ErrorMonitor& errors, Logger& log,
                         std::chrono::milliseconds idleWake)
    : handlers_(std::move(handlers)), errors_(errors), log_(log), idleWake_(idleWake) {
  if (!handlers_.execute)
    throw std::invalid_argument("[ActionQueue] execute handler is empty");
}

ActionQueue::~ActionQueue() { stop(std::chrono::milliseconds{ 0 }); }

void ActionQueue::setIdleHook(std::function<void()> hook) {
  std::lock_guard<std::mutex> lock(mtx_);
  idleHook_ = std::move(hook);
}

void ActionQueue::enqueue(ActionRequest request) {
  log_.trace(kComponent, "enqueue " + std::string(toString(request.kind)) + " from " +
                             request.source);
  {
    std::lock_guard<std::mutex> lock(mtx_);
    queue_.push_back(std::move(request));
  }
  cv_.notify_one();
}

void ActionQueue::start() {
  std::lock_guard<std::mutex> lock(mtx_);
  if (running_)
    return;
  running_ = true;
  exited_ = false;
  worker_ = std::thread([this] { loop(); });
}

bool ActionQueue::stop(std::chrono::milliseconds timeout) {
  if (!running_.exchange(false))
    return true;
  cv_.notify_all();

  bool inTime;
  {
    std::unique_lock<std::mutex> lock(mtx_);
    inTime = cv_.wait_for(lock, timeout, [this] { return exited_; });
  }
  if (!inTime)
    log_.warn(kComponent, "worker still finishing an action after " +
                              std::to_string(timeout.count()) + "ms");
  if (worker_.joinable())
    worker_.join();

  std::lock_guard<std::mutex> lock(mtx_);
  if (!queue_.empty()) {
    log_.info(kComponent, "discarding " + std::to_string(queue_.size()) + " queued action(s)");
    queue_.clear();
  }
  return inTime;
}

std::size_t ActionQueue::drain() {
  if (running_)
    throw std::logic_error("[ActionQueue] drain() while the worker is running");
  std::size_t n = 0;
  while (runNext())
    ++n;
  return n;
}

std::size_t ActionQueue::pending() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return queue_.size();
}

std::unique_lock<std::mutex> ActionQueue::tryLockIdle() {
  return std::unique_lock<std::mutex>(execMtx_, std::try_to_lock);
}

void ActionQueue::loop() {
  while (running_) {
    std::function<void()> hook;
    {
      std::unique_lock<std::mutex> lock(mtx_);
      cv_.wait_for(lock, idleWake_, [this] { return !queue_.empty() || !running_; });
      hook = idleHook_;
    }
    if (!running_)
      break;

    if (hook) {
      try {
        hook();
      } catch (const std::exception& e) {
        log_.error(kComponent, std::string("idle hook failed: ") + e.what());
      } catch (...) {
        log_.error(kComponent, "idle hook failed: unknown exception");
      }
    }

    while (running_ && runNext()) {
    }
  }

  {
    std::lock_guard<std::mutex> lock(mtx_);
    exited_ = true;
  }
  cv_.notify_all();
}

bool ActionQueue::runNext() {
  {
    std::lock_guard<std::mutex> lock(mtx_);
    if (queue_.empty())
      return false;
  }

  // the gate is taken before popping so a poll cycle holding it delays, never reorders
  std::lock_guard<std::mutex> gate(execMtx_);
  ActionRequest request;
  {
    std::lock_guard<std::mutex> lock(mtx_);
    if (queue_.empty())
      return false;
    request = std::move(queue_.front());
    queue_.pop_front();
  }

  busy_ = true;
  runOne(request);
  busy_ = false;
  return true;
}

void ActionQueue::runOne(const ActionRequest& request) {
  const std::string name(toString(request.kind));

  if (handlers_.prepare) {
    try {
      handlers_.prepare(request);
    } catch (const std::exception& e) {
      log_.warn(kComponent, "prepare for " + name + " failed: " + e.what());
    } catch (...) {
      log_.warn(kComponent, "prepare for " + name + " failed: unknown exception");
    }
  }

  try {
    log_.info(kComponent, "executing " + name + " (" + request.source + ")");
    handlers_.execute(request);
  } catch (const std::exception& e) {
    log_.error(kComponent, name + " failed: " + e.what());
    errors_.notifyFailure("Action '" + name + "' failed: " + e.what());
  } catch (...) {
    log_.error(kComponent, name + " failed: unknown exception");
    errors_.notifyFailure("Action '" + name + "' failed: unknown exception");
  }

  if (handlers_.cleanup) {
    try {
      handlers_.cleanup(request);
    } catch (const std::exception& e) {
      log_.warn(kComponent, "cleanup after " + name + " failed: " + e.what());
    } catch (...) {
      log_.warn(kComponent, "cleanup after " + name + " failed: unknown exception");
    }
  }
}
