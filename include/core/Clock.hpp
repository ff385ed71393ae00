#pragma once
/** @file  Clock.hpp
 *  @brief Injectable monotonic time source.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <chrono>

namespace radflow::core {

  /// Wraps std::chrono::steady_clock so state machines can be driven by a fake in tests.
  class Clock {
  public:
    using time_point = std::chrono::steady_clock::time_point;

    virtual ~Clock() = default;
    virtual time_point now() const { return std::chrono::steady_clock::now(); }
  };

} // namespace radflow::core
