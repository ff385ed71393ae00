/* @file DelayQueue.cpp
 * @brief single-thread deferred job runner
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <exception>

// radflow headers
#include "core/DelayQueue.hpp"
#include "core/Logger.hpp"

using namespace radflow::core;

DelayQueue::DelayQueue(Logger& log) : log_(log) {}

DelayQueue::~DelayQueue() { stop(); }

void DelayQueue::start() {
  std::lock_guard<std::mutex> lock(mtx_);
  if (running_)
    return;
  running_ = true;
  worker_ = std::thread([this] { loop(); });
}

void DelayQueue::stop() {
  {
    std::lock_guard<std::mutex> lock(mtx_);
    if (!running_)
      return;
    running_ = false;
    jobs_ = {};
  }
  cv_.notify_all();
  if (worker_.joinable())
    worker_.join();
}

void DelayQueue::runAfter(std::chrono::milliseconds delay, std::function<void()> job) {
  if (delay.count() < 0)
    delay = std::chrono::milliseconds{ 0 };
  {
    std::lock_guard<std::mutex> lock(mtx_);
    jobs_.push(Job{ std::chrono::steady_clock::now() + delay, nextSeq_++, std::move(job) });
  }
  cv_.notify_all();
}

std::size_t DelayQueue::pending() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return jobs_.size();
}

void DelayQueue::loop() {
  std::unique_lock<std::mutex> lock(mtx_);
  while (running_) {
    if (jobs_.empty()) {
      cv_.wait(lock);
      continue;
    }
    const auto due = jobs_.top().due;
    if (std::chrono::steady_clock::now() < due) {
      cv_.wait_until(lock, due);
      continue;
    }
    auto fn = jobs_.top().fn;
    jobs_.pop();

    lock.unlock();
    try {
      fn();
    } catch (const std::exception& e) {
      log_.error("DelayQueue", std::string("deferred job failed: ") + e.what());
    } catch (...) {
      log_.error("DelayQueue", "deferred job failed: unknown exception");
    }
    lock.lock();
  }
}
