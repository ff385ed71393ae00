#pragma once
/** @file  Presentation.hpp
 *  @brief Floating-window surfaces driven by the engine.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <optional>
#include <string>

#include "core/AlertState.hpp"

namespace radflow {
  namespace io {

    /**
 * @class Presentation
 * @brief Render-only sink; implementations must not call back into the engine.
 *
 * Calls arrive from the action worker and from the poll/sync timers.
 */
    class Presentation {
    public:
      virtual ~Presentation() = default;

      virtual void showToast(const std::string& message) = 0;
      virtual void showBlockingNotice(const std::string& title, const std::string& message) = 0;

      // --- alert surface ---
      virtual void showAlert(const core::Alert& alert) = 0;
      virtual void hideAlert() = 0;
      virtual void setAlertIndicators(const core::AlertConditions& conditions) = 0;

      // --- impression surface ---
      virtual void showImpression(const std::string& text) = 0;
      virtual void updateImpression(const std::string& text) = 0;
      virtual void hideImpression() = 0;

      // --- report view ---
      virtual void showReport(const std::string& text, const std::optional<std::string>& baseline) = 0;
      virtual void updateReport(const std::string& text,
                                const std::optional<std::string>& baseline) = 0;
      virtual void hideReport() = 0;

      virtual void setRecordingIndicator(bool recording) = 0;
      virtual void setProtocolState(bool flagged) = 0;
      virtual void ensureOverlaysOnTop() = 0;
    };

  } // namespace io
} // namespace radflow
