#pragma once
/** @file  ShellCommander.hpp
 *  @brief DesktopCommander that delegates to configured shell commands (xdotool, xclip, ...).
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <map>
#include <optional>
#include <string>

#include "io/DesktopCommander.hpp"

namespace radflow {
  namespace core {
    class Logger;
  } // namespace core

  namespace io {

    /**
 * @class ShellCommander
 * @brief Runs `/bin/sh -c <command>` for every desktop operation.
 *
 * Command table keys:
 *  * `keystroke.<name>` (see toString(Keystroke)), `activate`
 *  * `set_clipboard` (text on stdin), `get_clipboard` (text on stdout)
 *  * `save_focus`, `restore_focus`
 *  * `click_discard_study`, `click_create_impression`, `create_critical_note`
 *    (exit status 0 means success)
 *
 * A missing keystroke/activate/clipboard command throws; missing focus
 * commands are skipped; missing click commands report failure.
 */
    class ShellCommander : public DesktopCommander {
    public:
      ShellCommander(std::map<std::string, std::string> commands, core::Logger& log);

      void emitKeystroke(Keystroke k) override;
      void activateExternalApp() override;

      void setClipboardText(const std::string& text) override;
      std::optional<std::string> getClipboardText() override;

      void saveFocus() override;
      void restoreFocus() override;

      bool clickDiscardStudy() override;
      bool clickCreateImpression() override;
      bool createCriticalNote() override;

    private:
      const std::string* find(const std::string& key) const;
      const std::string& require(const std::string& key) const;

      int run(const std::string& command);
      void runChecked(const std::string& key);
      bool runStatus(const std::string& key);

      std::map<std::string, std::string> commands_;
      core::Logger& log_;
    };

  } // namespace io
} // namespace radflow
