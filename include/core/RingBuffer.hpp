#pragma once
/** @file  RingBuffer.hpp
 *  @brief Bounded, lock-protected FIFO used by the async Logger.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <vector>

namespace radflow {
  namespace core {

    /**
 * @class RingBuffer
 * @brief Fixed-capacity ring of T.
 *
 *  * Policy: drop-new on full; `dropped()` counts the rejected pushes.
 *  * Many producers, one consumer.
 */
    template <typename T> class RingBuffer {
    public:
      explicit RingBuffer(std::size_t capacity) : slots_(capacity == 0 ? 1 : capacity) {}

      /// @returns false (and bumps the drop counter) when the ring is full.
      bool tryPush(T item) {
        std::lock_guard<std::mutex> lock(mtx_);
        if (count_ == slots_.size()) {
          ++dropped_;
          return false;
        }
        slots_[(head_ + count_) % slots_.size()] = std::move(item);
        ++count_;
        return true;
      }

      std::optional<T> tryPop() {
        std::lock_guard<std::mutex> lock(mtx_);
        if (count_ == 0)
          return std::nullopt;
        T out = std::move(slots_[head_]);
        head_ = (head_ + 1) % slots_.size();
        --count_;
        return out;
      }

      std::size_t size() const {
        std::lock_guard<std::mutex> lock(mtx_);
        return count_;
      }

      std::size_t capacity() const { return slots_.size(); }

      std::uint64_t dropped() const {
        std::lock_guard<std::mutex> lock(mtx_);
        return dropped_;
      }

    private:
      std::vector<T> slots_;
      std::size_t head_{ 0 };
      std::size_t count_{ 0 };
      std::uint64_t dropped_{ 0 };
      mutable std::mutex mtx_;
    };

  } // namespace core
} // namespace radflow
