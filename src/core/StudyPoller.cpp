/* @file StudyPoller.cpp
 * @brief case lifecycle, baseline capture, alerts and impression search per poll
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <exception>
#include <utility>
#include <vector>

// radflow headers
#include "core/ActionQueue.hpp"
#include "core/AlertArbitrator.hpp"
#include "core/CriticalNoteTracker.hpp"
#include "core/Logger.hpp"
#include "core/SettingsStore.hpp"
#include "core/StudyPoller.hpp"
#include "io/ExternalOracle.hpp"
#include "io/Presentation.hpp"
#include "io/StudyEventSink.hpp"
#include "report/ReportText.hpp"

using namespace radflow::core;
using radflow::io::CaseSnapshot;
using radflow::io::StudyOutcome;

namespace {
  constexpr std::string_view kComponent = "StudyPoller";
  constexpr int kMacroBlankLines = 10;

  std::string join(const std::vector<std::string>& items, std::string_view sep) {
    std::string out;
    for (const auto& item : items) {
      if (!out.empty())
        out += sep;
      out += item;
    }
    return out;
  }
} // namespace

StudyPoller::StudyPoller(io::ExternalOracle& oracle, io::Presentation& presentation,
                         io::StudyEventSink& events, ActionQueue& queue, AlertArbitrator& alerts,
                         CriticalNoteTracker& notes, SettingsStore& settings, Logger& log,
                         const Clock& clock)
    : oracle_(oracle), presentation_(presentation), events_(events), queue_(queue),
      alerts_(alerts), notes_(notes), settings_(settings), log_(log), search_(clock) {}

void StudyPoller::setIntervalListener(std::function<void(std::chrono::milliseconds)> listener) {
  std::lock_guard<std::mutex> lock(mtx_);
  intervalListener_ = std::move(listener);
}

std::chrono::milliseconds StudyPoller::desiredInterval() const {
  const Settings s = settings_.snapshot();
  std::lock_guard<std::mutex> lock(mtx_);
  return intervalFor(s);
}

void StudyPoller::tick() {
  const Settings s = settings_.snapshot();
  if (!s.scrapeEnabled)
    return;

  auto gate = queue_.tryLockIdle();
  if (!gate.owns_lock()) {
    log_.trace(kComponent, "action executing; poll skipped");
    return;
  }

  try {
    runCycle(s);
  } catch (const std::exception& e) {
    log_.warn(kComponent, std::string("poll cycle abandoned: ") + e.what());
  } catch (...) {
    log_.warn(kComponent, "poll cycle abandoned: unknown exception");
  }
}

void StudyPoller::runCycle(const Settings& s) {
  auto snap = oracle_.probeCaseSnapshot();
  if (!snap) {
    log_.trace(kComponent, "snapshot unknown; cycle skipped");
    return;
  }
  const bool discardVisible = oracle_.probeDiscardDialogVisible().value_or(false);

  std::optional<bool> protocolFlag;
  if (s.protocolDetectionEnabled) {
    std::string incoming;
    std::string live;
    {
      std::lock_guard<std::mutex> lock(mtx_);
      incoming = effectiveAccession(snap->accession);
      live = case_.accession;
    }
    if (!incoming.empty() && incoming != live)
      protocolFlag = oracle_.probeProtocolFlag(incoming);
  }

  applyCycle(*snap, discardVisible, protocolFlag, s);
}

std::string StudyPoller::effectiveAccession(const std::string& scraped) const {
  // a discarded study may linger on screen for a poll or two
  return scraped == discardedAccession_ ? std::string{} : scraped;
}

void StudyPoller::applyCycle(const CaseSnapshot& snap, bool discardVisible,
                             std::optional<bool> protocolFlag, const Settings& s) {
  std::lock_guard<std::mutex> lock(mtx_);
  lastReport_ = snap.reportText;

  if (discardVisible && case_.open() && !case_.discardRequested) {
    case_.discardRequested = true;
    log_.info(kComponent, "discard dialog seen for " + case_.accession);
  }

  const std::string incoming = effectiveAccession(snap.accession);
  if (!discardedAccession_.empty() && snap.accession != discardedAccession_)
    discardedAccession_.clear();

  const bool changed =
      (!incoming.empty() && incoming != case_.accession) || (case_.open() && incoming.empty());
  if (changed) {
    log_.info(kComponent, "study change: '" + case_.accession + "' -> '" + incoming + "'");
    if (case_.open()) {
      StudyOutcome outcome = StudyOutcome::Signed;
      if (!case_.isSigned && case_.discardRequested)
        outcome = StudyOutcome::ClosedUnsigned;
      log_.info(kComponent, std::string("closing ") + case_.accession + " as " + toString(outcome));
      events_.onStudyClosed(case_.accession, outcome);
    }
    resetCase();
    if (!incoming.empty())
      openCase(snap, protocolFlag, s);
  }

  if (!case_.open()) {
    publishInterval(s);
    return;
  }

  if (case_.needsBaseline && !case_.processPressed && report::hasCompleteMarker(snap.reportText)) {
    case_.baselineReport = snap.reportText;
    case_.needsBaseline = false;
    log_.trace(kComponent, "baseline captured (" + std::to_string(snap.reportText.size()) +
                               " chars)");
  }

  if (!pendingMacroAccession_.empty() && pendingMacroAccession_ == case_.accession &&
      report::hasClinicalHistory(snap.reportText)) {
    queueMacros(s);
    pendingMacroAccession_.clear();
    pendingMacroDescription_.clear();
  }

  if (reportViewOpen_ && !snap.reportText.empty() && snap.reportText != reportViewText_) {
    reportViewText_ = snap.reportText;
    presentation_.updateReport(snap.reportText, viewBaseline(s));
  }

  alerts_.present(evaluateAlerts(snap, s), s, presentation_);

  if (s.protocolAutoCreateNote && case_.protocolFlag && case_.processPressed &&
      !case_.criticalNoteRequested && !notes_.hasNoteFor(case_.accession)) {
    case_.criticalNoteRequested = true;
    queue_.enqueue(ActionRequest{ ActionKind::CreateCriticalNote, std::string(sources::kPoller) });
  }

  if (s.showImpression)
    stepImpression(snap, s);

  publishInterval(s);
}

void StudyPoller::resetCase() {
  notes_.reset();
  alerts_.reset(presentation_);
  if (search_.active() || search_.autoShown() || !impressionShown_.empty())
    presentation_.hideImpression();
  search_.end();
  impressionShown_.clear();
  if (case_.protocolFlag)
    presentation_.setProtocolState(false);
  case_ = CaseContext{};
  pendingMacroAccession_.clear();
  pendingMacroDescription_.clear();
  pendingMacroText_.clear();
}

void StudyPoller::openCase(const CaseSnapshot& snap, std::optional<bool> protocolFlag,
                           const Settings& s) {
  case_.accession = snap.accession;
  case_.description = snap.description;
  case_.needsBaseline = s.showReportChanges;
  presentation_.showToast("New Study: " + snap.accession);

  if (s.macrosEnabled) {
    pendingMacroAccession_ = snap.accession;
    pendingMacroDescription_ = snap.description;
  }

  if (s.protocolDetectionEnabled) {
    bool flagged = protocolFlag.value_or(false);
    if (!flagged && s.protocolDetectionUseClinicalHistory)
      flagged = report::containsProtocolKeywords(report::extractClinicalHistory(snap.reportText));
    case_.protocolFlag = flagged;
    presentation_.setProtocolState(flagged);
    if (flagged) {
      log_.info(kComponent, "stroke protocol flagged for " + snap.accession);
      presentation_.showToast("Stroke protocol: " + snap.accession);
    }
  }
}

void StudyPoller::queueMacros(const Settings& s) {
  std::string text;
  if (s.macrosBlankLinesBefore) {
    // single spaces keep the editor from collapsing the blank lines
    for (int i = 0; i < kMacroBlankLines; ++i)
      text += " \n";
  }

  std::vector<std::string> bodies;
  for (const auto& macro : s.macros) {
    if (macro.enabled && macro.criteria.matches(pendingMacroDescription_) &&
        macro.text.find_first_not_of(" \t\r\n") != std::string::npos)
      bodies.push_back(macro.text);
  }
  if (bodies.empty()) {
    log_.trace(kComponent, "no macros match '" + pendingMacroDescription_ + "'");
    return;
  }
  text += join(bodies, "\n");

  pendingMacroText_ = std::move(text);
  log_.info(kComponent, std::to_string(bodies.size()) + " macro(s) queued for " + case_.accession);
  queue_.enqueue(ActionRequest{ ActionKind::InsertMacros, std::string(sources::kInternal) });
}

AlertConditions StudyPoller::evaluateAlerts(const CaseSnapshot& snap, const Settings& s) const {
  AlertConditions c;
  c.drafted = s.showDraftedIndicator && snap.drafted;

  if (s.genderCheckEnabled) {
    auto hits = report::checkGenderMismatch(snap.reportText, snap.patientGender);
    if (!hits.empty()) {
      c.genderMismatch = true;
      c.genderDetail = "Patient is " + snap.patientGender + "; report mentions " + join(hits, ", ");
    }
  }

  if (s.showTemplateMismatch) {
    const std::string description =
        snap.description.empty() ? case_.description : snap.description;
    const std::string templateName = snap.templateName.empty()
                                         ? report::extractTemplateName(snap.reportText)
                                         : snap.templateName;
    if (!report::doBodyPartsMatch(description, templateName)) {
      c.templateMismatch = true;
      c.templateDetail = "Study: " + description + " / Template: " + templateName;
    }
  }

  if (s.protocolDetectionEnabled && case_.protocolFlag) {
    c.protocolFlag = true;
    c.protocolDetail = "Stroke protocol";
  }
  return c;
}

void StudyPoller::stepImpression(const CaseSnapshot& snap, const Settings& s) {
  const std::string impression = report::extractImpression(snap.reportText);
  switch (search_.step(impression, snap.drafted, s.impressionSettle)) {
  case ImpressionSearch::Step::Found:
    log_.info(kComponent, "impression found");
    impressionShown_ = impression;
    presentation_.updateImpression(impression);
    break;
  case ImpressionSearch::Step::RefreshPinned:
    if (impression != impressionShown_) {
      impressionShown_ = impression;
      presentation_.updateImpression(impression);
    }
    break;
  case ImpressionSearch::Step::AutoShow:
    impressionShown_ = impression;
    presentation_.showImpression(impression);
    break;
  case ImpressionSearch::Step::AutoHide:
    impressionShown_.clear();
    presentation_.hideImpression();
    break;
  case ImpressionSearch::Step::None:
    break;
  }
}

std::optional<std::string> StudyPoller::viewBaseline(const Settings& s) const {
  if (s.showReportChanges && case_.processPressed)
    return case_.baselineReport;
  return std::nullopt;
}

std::chrono::milliseconds StudyPoller::intervalFor(const Settings& s) const {
  switch (search_.mode()) {
  case ImpressionMode::Fast:
    return s.fastScrapeInterval;
  case ImpressionMode::Found:
    return s.postImpressionScrapeInterval;
  default:
    return s.scrapeInterval;
  }
}

void StudyPoller::publishInterval(const Settings& s) {
  const auto interval = intervalFor(s);
  if (publishedInterval_ && *publishedInterval_ == interval)
    return;
  publishedInterval_ = interval;
  if (intervalListener_)
    intervalListener_(interval);
}

// ---- action hooks ---------------------------------------------------------

void StudyPoller::markProcessPressed() {
  std::lock_guard<std::mutex> lock(mtx_);
  case_.processPressed = true;
}

void StudyPoller::markSigned() {
  std::lock_guard<std::mutex> lock(mtx_);
  case_.isSigned = true;
}

void StudyPoller::markDiscardRequested() {
  std::lock_guard<std::mutex> lock(mtx_);
  case_.discardRequested = true;
}

void StudyPoller::closeCaseAfterDiscard() {
  const Settings s = settings_.snapshot();
  std::lock_guard<std::mutex> lock(mtx_);
  if (!case_.open())
    return;
  log_.info(kComponent, "closing " + case_.accession + " as CLOSED_UNSIGNED (discarded)");
  events_.onStudyClosed(case_.accession, StudyOutcome::ClosedUnsigned);
  discardedAccession_ = case_.accession;
  resetCase();
  publishInterval(s);
}

void StudyPoller::beginImpressionSearch() {
  const Settings s = settings_.snapshot();
  std::lock_guard<std::mutex> lock(mtx_);
  search_.begin();
  impressionShown_.clear();
  presentation_.showImpression("Searching for impression...");
  publishInterval(s);
}

void StudyPoller::endImpressionSearch() {
  const Settings s = settings_.snapshot();
  std::lock_guard<std::mutex> lock(mtx_);
  if (search_.active() || search_.autoShown() || !impressionShown_.empty())
    presentation_.hideImpression();
  search_.end();
  impressionShown_.clear();
  publishInterval(s);
}

void StudyPoller::setReportViewOpen(bool open, const std::string& shownText) {
  std::lock_guard<std::mutex> lock(mtx_);
  reportViewOpen_ = open;
  reportViewText_ = open ? shownText : std::string{};
}

std::string StudyPoller::takePendingMacroText() {
  std::lock_guard<std::mutex> lock(mtx_);
  return std::exchange(pendingMacroText_, std::string{});
}

// ---- queries --------------------------------------------------------------

bool StudyPoller::isCaseOpen() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return case_.open();
}

std::string StudyPoller::currentAccession() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return case_.accession;
}

CaseContext StudyPoller::caseContext() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return case_;
}

std::string StudyPoller::lastReport() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return lastReport_;
}

std::optional<std::string> StudyPoller::baseline() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return case_.baselineReport;
}

bool StudyPoller::reportViewOpen() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return reportViewOpen_;
}

ImpressionMode StudyPoller::impressionMode() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return search_.mode();
}
