/* @file PasteGuard.cpp
 * @brief locked clipboard paste sequence
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <thread>

// radflow headers
#include "core/Logger.hpp"
#include "core/PasteGuard.hpp"
#include "io/DesktopCommander.hpp"

using namespace radflow::core;

PasteGuard::PasteGuard(io::DesktopCommander& desktop, Logger& log, const Clock& clock)
    : desktop_(desktop), log_(log), clock_(clock) {}

void PasteGuard::paste(const std::string& text, const Settings& settings) {
  std::lock_guard<std::mutex> lock(mtx_);
  const auto& pacing = settings.pacing;

  desktop_.setClipboardText(text);
  std::this_thread::sleep_for(pacing.clipboardSettle);
  desktop_.activateExternalApp();
  std::this_thread::sleep_for(pacing.activation);
  desktop_.emitKeystroke(io::Keystroke::Paste);
  std::this_thread::sleep_for(pacing.pasteSettle);

  lastPaste_ = clock_.now();
  log_.trace("PasteGuard", "pasted " + std::to_string(text.size()) + " chars");

  if (settings.restoreFocusAfterAction)
    desktop_.restoreFocus();
}

std::optional<Clock::time_point> PasteGuard::lastPasteTime() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return lastPaste_;
}
