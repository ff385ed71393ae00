#pragma once
/** @file  ConsolePresenter.hpp
 *  @brief Headless rendering of surfaces, cues and study events as console lines.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <mutex>
#include <ostream>
#include <string>

#include "io/AudioCue.hpp"
#include "io/Presentation.hpp"
#include "io/StudyEventSink.hpp"

namespace radflow {
  namespace core {
    class Logger;
  } // namespace core

  namespace io {

    class ConsolePresenter : public Presentation, public AudioCue, public StudyEventSink {
    public:
      ConsolePresenter(std::ostream& out, core::Logger& log);

      // Presentation
      void showToast(const std::string& message) override;
      void showBlockingNotice(const std::string& title, const std::string& message) override;
      void showAlert(const core::Alert& alert) override;
      void hideAlert() override;
      void setAlertIndicators(const core::AlertConditions& conditions) override;
      void showImpression(const std::string& text) override;
      void updateImpression(const std::string& text) override;
      void hideImpression() override;
      void showReport(const std::string& text, const std::optional<std::string>& baseline) override;
      void updateReport(const std::string& text,
                        const std::optional<std::string>& baseline) override;
      void hideReport() override;
      void setRecordingIndicator(bool recording) override;
      void setProtocolState(bool flagged) override;
      void ensureOverlaysOnTop() override {}

      // AudioCue
      void playAudioCue(int frequencyHz, int durationMs, double volume) override;

      // StudyEventSink
      void onStudyClosed(const std::string& accession, StudyOutcome outcome) override;

    private:
      void line(const std::string& tag, const std::string& text);

      std::ostream& out_;
      core::Logger& log_;
      std::mutex mtx_;
    };

  } // namespace io
} // namespace radflow
