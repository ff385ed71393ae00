#pragma once
/** @file  PasteGuard.hpp
 *  @brief Serializes clipboard-and-paste side effects.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <mutex>
#include <optional>
#include <string>

#include "core/Clock.hpp"
#include "core/Settings.hpp"

namespace radflow {
  namespace io {
    class DesktopCommander;
  } // namespace io

  namespace core {

    class Logger;

    class PasteGuard {
    public:
      PasteGuard(io::DesktopCommander& desktop, Logger& log, const Clock& clock);

      /// clipboard -> settle -> activate -> settle -> paste -> settle [-> restore focus]
      void paste(const std::string& text, const Settings& settings);

      std::optional<Clock::time_point> lastPasteTime() const;

    private:
      io::DesktopCommander& desktop_;
      Logger& log_;
      const Clock& clock_;
      mutable std::mutex mtx_;
      std::optional<Clock::time_point> lastPaste_;
    };

  } // namespace core
} // namespace radflow
