/* @file ConsolePresenter.cpp
 * @brief console rendering for the headless build
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

#include "io/ConsolePresenter.hpp"
#include "core/Logger.hpp"

using namespace radflow::io;

ConsolePresenter::ConsolePresenter(std::ostream& out, core::Logger& log) : out_(out), log_(log) {}

void ConsolePresenter::line(const std::string& tag, const std::string& text) {
  {
    std::lock_guard<std::mutex> lock(mtx_);
    out_ << "[" << tag << "] " << text << std::endl;
  }
  log_.trace("Console", tag + ": " + text);
}

void ConsolePresenter::showToast(const std::string& message) { line("toast", message); }

void ConsolePresenter::showBlockingNotice(const std::string& title, const std::string& message) {
  line("notice", title + ": " + message);
}

void ConsolePresenter::showAlert(const core::Alert& alert) {
  line("alert", std::string(core::toString(alert.kind)) +
                    (alert.detail.empty() ? "" : " - " + alert.detail));
}

void ConsolePresenter::hideAlert() { line("alert", "(hidden)"); }

void ConsolePresenter::setAlertIndicators(const core::AlertConditions& c) {
  line("indicators", std::string("gender=") + (c.genderMismatch ? "!" : "ok") +
                         " template=" + (c.templateMismatch ? "!" : "ok") +
                         " protocol=" + (c.protocolFlag ? "!" : "ok") +
                         " drafted=" + (c.drafted ? "yes" : "no"));
}

void ConsolePresenter::showImpression(const std::string& text) { line("impression", text); }

void ConsolePresenter::updateImpression(const std::string& text) { line("impression", text); }

void ConsolePresenter::hideImpression() { line("impression", "(hidden)"); }

void ConsolePresenter::showReport(const std::string& text,
                                  const std::optional<std::string>& baseline) {
  line("report", std::to_string(text.size()) + " chars" +
                     (baseline ? ", baseline " + std::to_string(baseline->size()) + " chars" : ""));
  std::lock_guard<std::mutex> lock(mtx_);
  out_ << text << std::endl;
}

void ConsolePresenter::updateReport(const std::string& text,
                                    const std::optional<std::string>& baseline) {
  showReport(text, baseline);
}

void ConsolePresenter::hideReport() { line("report", "(closed)"); }

void ConsolePresenter::setRecordingIndicator(bool recording) {
  line("dictation", recording ? "RECORDING" : "stopped");
}

void ConsolePresenter::setProtocolState(bool flagged) {
  line("protocol", flagged ? "flagged" : "clear");
}

void ConsolePresenter::playAudioCue(int frequencyHz, int durationMs, double volume) {
  // terminal bell; frequency and volume are logged only
  {
    std::lock_guard<std::mutex> lock(mtx_);
    out_ << '\a' << std::flush;
  }
  log_.trace("Console", "cue " + std::to_string(frequencyHz) + "Hz " + std::to_string(durationMs) +
                            "ms vol " + std::to_string(volume));
}

void ConsolePresenter::onStudyClosed(const std::string& accession, StudyOutcome outcome) {
  line("study", accession + " " + toString(outcome));
  log_.info("StudyEvents", accession + "," + toString(outcome));
}
