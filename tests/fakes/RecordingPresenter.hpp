#pragma once
/** @file  RecordingPresenter.hpp
 *  @brief Presentation + StudyEventSink + AudioCue that record what they were asked to do.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "io/AudioCue.hpp"
#include "io/Presentation.hpp"
#include "io/StudyEventSink.hpp"

namespace radflow {
  namespace test {

    struct Cue {
      int hz;
      int ms;
      double volume;
    };

    class RecordingPresenter : public io::Presentation,
                               public io::StudyEventSink,
                               public io::AudioCue {
    public:
      std::vector<std::string> toasts;
      std::vector<std::pair<std::string, std::string>> notices;
      std::vector<core::Alert> alertsShown;
      int alertHides = 0;
      std::vector<core::AlertConditions> indicators;
      std::vector<std::string> impression; ///< "show:..", "update:..", "hide"
      std::vector<std::string> reportCalls; ///< "show", "update", "hide"
      std::optional<std::string> lastBaseline;
      std::vector<bool> recordingIndicator;
      std::vector<bool> protocolStates;
      int overlayRaises = 0;
      std::vector<std::pair<std::string, io::StudyOutcome>> studyEvents;
      std::vector<Cue> cues;

      void showToast(const std::string& message) override {
        std::lock_guard<std::mutex> lock(mtx_);
        toasts.push_back(message);
      }
      void showBlockingNotice(const std::string& title, const std::string& message) override {
        notices.emplace_back(title, message);
      }
      void showAlert(const core::Alert& alert) override { alertsShown.push_back(alert); }
      void hideAlert() override { ++alertHides; }
      void setAlertIndicators(const core::AlertConditions& c) override { indicators.push_back(c); }
      void showImpression(const std::string& text) override { impression.push_back("show:" + text); }
      void updateImpression(const std::string& text) override {
        impression.push_back("update:" + text);
      }
      void hideImpression() override { impression.emplace_back("hide"); }
      void showReport(const std::string&, const std::optional<std::string>& baseline) override {
        reportCalls.emplace_back("show");
        lastBaseline = baseline;
      }
      void updateReport(const std::string&, const std::optional<std::string>& baseline) override {
        reportCalls.emplace_back("update");
        lastBaseline = baseline;
      }
      void hideReport() override { reportCalls.emplace_back("hide"); }
      void setRecordingIndicator(bool recording) override {
        recordingIndicator.push_back(recording);
      }
      void setProtocolState(bool flagged) override { protocolStates.push_back(flagged); }
      void ensureOverlaysOnTop() override { ++overlayRaises; }

      void onStudyClosed(const std::string& accession, io::StudyOutcome outcome) override {
        studyEvents.emplace_back(accession, outcome);
      }

      void playAudioCue(int frequencyHz, int durationMs, double volume) override {
        cues.push_back(Cue{ frequencyHz, durationMs, volume });
      }

      std::vector<std::string> toastSnapshot() {
        std::lock_guard<std::mutex> lock(mtx_);
        return toasts;
      }

    private:
      std::mutex mtx_; ///< toasts may arrive from the action worker
    };

  } // namespace test
} // namespace radflow
