#pragma once
/** @file  DesktopCommander.hpp
 *  @brief Side-effecting desktop automation (keystrokes, clipboard, focus, clicks).
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <cstdint>
#include <optional>
#include <string>

namespace radflow {
  namespace io {

    enum class Keystroke : std::uint8_t {
      ToggleRecord,
      ProcessReport,
      SignReport,
      Paste,
      Copy,
      PageDown,
      ReleaseModifiers,
      Count
    };
    static_assert(static_cast<std::uint8_t>(Keystroke::Count) == 7,
                  "Keystroke count changed please update toString");

    inline const char* toString(Keystroke k) {
      switch (k) {
      case Keystroke::ToggleRecord:
        return "toggle_record";
      case Keystroke::ProcessReport:
        return "process_report";
      case Keystroke::SignReport:
        return "sign_report";
      case Keystroke::Paste:
        return "paste";
      case Keystroke::Copy:
        return "copy";
      case Keystroke::PageDown:
        return "page_down";
      case Keystroke::ReleaseModifiers:
        return "release_modifiers";
      default:
        return "unknown";
      }
    }

    /**
 * @class DesktopCommander
 * @brief Everything that touches the shared clipboard or keyboard focus.
 *
 * Only the action worker calls into this interface. Void methods throw
 * `std::runtime_error` on failure; the click helpers report failure by value.
 */
    class DesktopCommander {
    public:
      virtual ~DesktopCommander() = default;

      virtual void emitKeystroke(Keystroke k) = 0;
      virtual void activateExternalApp() = 0;

      virtual void setClipboardText(const std::string& text) = 0;
      virtual std::optional<std::string> getClipboardText() = 0;

      virtual void saveFocus() = 0;
      virtual void restoreFocus() = 0;

      virtual bool clickDiscardStudy() = 0;
      virtual bool clickCreateImpression() = 0;
      virtual bool createCriticalNote() = 0;
    };

  } // namespace io
} // namespace radflow
