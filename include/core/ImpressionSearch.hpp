#pragma once
/** @file  ImpressionSearch.hpp
 *  @brief Two-speed search for the generated impression after Process Report.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <chrono>
#include <string>

#include "core/Clock.hpp"

namespace radflow::core {

  enum class ImpressionMode { Idle, Fast, Found };

  const char* toString(ImpressionMode mode);

  /**
 * @class ImpressionSearch
 * @brief Fast -> Found once the impression is non-empty AND the settle time
 *        since `begin()` has elapsed; any mode -> Idle on `end()`.
 *
 * In Idle the search still tracks drafted reports so the impression surface
 * can be auto-shown and later auto-hidden. Not thread-safe; the owner locks.
 */
  class ImpressionSearch {
  public:
    enum class Step { None, Found, RefreshPinned, AutoShow, AutoHide };

    explicit ImpressionSearch(const Clock& clock) : clock_(clock) {}

    void begin();
    void end();

    Step step(const std::string& impression, bool drafted, std::chrono::milliseconds settle);

    ImpressionMode mode() const { return mode_; }
    bool active() const { return mode_ != ImpressionMode::Idle; }
    bool autoShown() const { return autoShown_; }

  private:
    const Clock& clock_;
    ImpressionMode mode_{ ImpressionMode::Idle };
    Clock::time_point startedAt_{};
    bool autoShown_{ false };
  };

} // namespace radflow::core
