#pragma once
/** @file  TestSettings.hpp
 *  @brief Settings with every pacing sleep zeroed.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include "core/Settings.hpp"

namespace radflow::test {

  inline core::Settings fastSettings() {
    core::Settings s;
    s.pacing = core::Pacing{ std::chrono::milliseconds{ 0 }, std::chrono::milliseconds{ 0 },
                             std::chrono::milliseconds{ 0 }, std::chrono::milliseconds{ 0 },
                             std::chrono::milliseconds{ 0 }, std::chrono::milliseconds{ 0 },
                             std::chrono::milliseconds{ 0 } };
    s.idleWake = std::chrono::milliseconds{ 20 };
    s.logPath = "";
    return s;
  }

} // namespace radflow::test
