/* @file ReadingCoordinator.cpp
 * @brief wiring of queue, timers and reconcilers + every action body
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <stdexcept>
#include <thread>

// radflow headers
#include "core/ErrorMonitor.hpp"
#include "core/Errors.hpp"
#include "core/Logger.hpp"
#include "core/ReadingCoordinator.hpp"
#include "core/SettingsStore.hpp"
#include "io/AudioCue.hpp"
#include "io/ExternalOracle.hpp"
#include "io/Presentation.hpp"
#include "io/StudyEventSink.hpp"
#include "report/ReportText.hpp"

using namespace radflow::core;
using radflow::io::Keystroke;

namespace {
  constexpr std::string_view kComponent = "Coordinator";
}

ReadingCoordinator::ReadingCoordinator(Collaborators io, SettingsStore& settings, Logger& log,
                                       ErrorMonitor& errors, Deferrer* deferrer,
                                       const Clock* clock)
    : io_(io), settings_(settings), log_(log), errors_(errors),
      clock_(clock ? *clock : defaultClock_),
      ownDelay_(deferrer ? std::unique_ptr<DelayQueue>{} : std::make_unique<DelayQueue>(log)),
      deferrer_(deferrer ? *deferrer : *ownDelay_), notes_(log), paste_(io.desktop, log, clock_),
      queue_(ActionQueue::Handlers{ [this](const ActionRequest& r) { prepare(r); },
                                    [this](const ActionRequest& r) { execute(r); },
                                    [this](const ActionRequest& r) { cleanup(r); } },
             errors, log, settings.snapshot().idleWake),
      dictation_(io.oracle, io.desktop, io.audio, io.presentation, deferrer_, settings, log, clock_),
      poller_(io.oracle, io.presentation, io.events, queue_, alerts_, notes_, settings, log,
              clock_) {
  errors_.registerEscalation([this](const std::string& message) {
    io_.presentation.showToast(message);
  });
  queue_.setIdleHook([this] { idle(); });
}

ReadingCoordinator::~ReadingCoordinator() {
  stop();
  errors_.registerEscalation(nullptr);
}

void ReadingCoordinator::start() {
  if (started_.exchange(true))
    return;
  const Settings s = settings_.snapshot();

  if (ownDelay_)
    ownDelay_->start();
  queue_.start();

  syncTimer_ = std::make_unique<PeriodicTimer>("DictationSync", s.dictationSyncInterval,
                                               [this] { dictation_.syncTick(); }, log_);
  pollTimer_ = std::make_unique<PeriodicTimer>("StudyPoller", poller_.desiredInterval(),
                                               [this] { poller_.tick(); }, log_);
  housekeepingTimer_ = std::make_unique<PeriodicTimer>("Housekeeping", s.housekeepingInterval,
                                                       [this] { housekeeping(); }, log_);
  poller_.setIntervalListener([this](std::chrono::milliseconds interval) {
    pollTimer_->setInterval(interval);
  });

  syncTimer_->start();
  pollTimer_->start(s.scrapeInterval);
  housekeepingTimer_->start(s.housekeepingInterval);
  log_.info(kComponent, "started");
}

void ReadingCoordinator::stop() {
  if (!started_.exchange(false))
    return;
  poller_.setIntervalListener(nullptr);
  for (auto* timer : { pollTimer_.get(), syncTimer_.get(), housekeepingTimer_.get() }) {
    if (timer)
      timer->stop();
  }
  queue_.stop(settings_.snapshot().shutdownTimeout);
  if (ownDelay_)
    ownDelay_->stop();
  log_.info(kComponent, "stopped");
}

void ReadingCoordinator::enqueue(ActionRequest request) { queue_.enqueue(std::move(request)); }

void ReadingCoordinator::applySettings(Settings next) {
  const auto sync = next.dictationSyncInterval;
  const auto housekeep = next.housekeepingInterval;
  settings_.replace(std::move(next));
  if (syncTimer_)
    syncTimer_->setInterval(sync);
  if (housekeepingTimer_)
    housekeepingTimer_->setInterval(housekeep);
  if (pollTimer_)
    pollTimer_->setInterval(poller_.desiredInterval());
  log_.info(kComponent, "settings applied (revision " + std::to_string(settings_.revision()) + ")");
}

// ---- event entry points ---------------------------------------------------

bool ReadingCoordinator::onDeviceButton(const std::string& button) {
  const Settings s = settings_.snapshot();
  if (s.deadManSwitch && button == sources::kRecordButton)
    return true; // press/release handled by onRecordButtonState()

  for (const auto& [kind, binding] : s.actionBindings) {
    if (!binding.micButton.empty() && binding.micButton == button) {
      enqueue(ActionRequest{ kind, button });
      return true;
    }
  }
  log_.trace(kComponent, "unmapped button '" + button + "'");
  return false;
}

bool ReadingCoordinator::onHotkey(const std::string& hotkey) {
  const Settings s = settings_.snapshot();
  for (const auto& [kind, binding] : s.actionBindings) {
    if (!binding.hotkey.empty() && binding.hotkey == hotkey) {
      enqueue(ActionRequest{ kind, std::string(sources::kHotkey) });
      return true;
    }
  }
  return false;
}

void ReadingCoordinator::onRecordButtonState(bool pressed) {
  recordHeld_ = pressed;
  const Settings s = settings_.snapshot();
  if (!s.deadManSwitch) {
    if (pressed)
      onDeviceButton(std::string(sources::kRecordButton));
    return;
  }

  const bool recording = dictation_.believed();
  if (pressed && !recording)
    enqueue(ActionRequest{ ActionKind::StartRecording, std::string(sources::kRecordButton) });
  else if (!pressed && recording)
    enqueue(ActionRequest{ ActionKind::StopRecording, std::string(sources::kRecordButton) });
}

void ReadingCoordinator::selectPickListItem(const std::string& listName, std::size_t index) {
  {
    std::lock_guard<std::mutex> lock(pickMtx_);
    pendingPick_ = PendingPick{ listName, index };
  }
  enqueue(ActionRequest{ ActionKind::InsertPickListText, std::string(sources::kManual) });
}

// ---- queries --------------------------------------------------------------

bool ReadingCoordinator::isCaseOpen() const { return poller_.isCaseOpen(); }

std::string ReadingCoordinator::currentAccession() const { return poller_.currentAccession(); }

bool ReadingCoordinator::hasCriticalNoteFor(const std::string& accession) const {
  return notes_.hasNoteFor(accession);
}

bool ReadingCoordinator::recordingBelieved() const { return dictation_.believed(); }

std::vector<std::string> ReadingCoordinator::availablePickLists() const {
  const Settings s = settings_.snapshot();
  std::vector<std::string> names;
  if (!s.pickListsEnabled)
    return names;
  const std::string description = poller_.caseContext().description;
  for (const auto& list : s.pickLists) {
    if (list.enabled && list.criteria.matches(description))
      names.push_back(list.name);
  }
  return names;
}

// ---- manual stepping ------------------------------------------------------

std::size_t ReadingCoordinator::drainPending() { return queue_.drain(); }

void ReadingCoordinator::pollNow() { poller_.tick(); }

void ReadingCoordinator::syncDictationNow() { dictation_.syncTick(); }

void ReadingCoordinator::housekeepingNow() { housekeeping(); }

// ---- action loop hooks ----------------------------------------------------

void ReadingCoordinator::prepare(const ActionRequest&) {
  if (settings_.snapshot().restoreFocusAfterAction)
    io_.desktop.saveFocus();
}

void ReadingCoordinator::cleanup(const ActionRequest&) {
  const Settings s = settings_.snapshot();
  if (s.restoreFocusAfterAction) {
    std::this_thread::sleep_for(s.pacing.focusRestore);
    io_.desktop.restoreFocus();
  }
  io_.presentation.ensureOverlaysOnTop();
}

void ReadingCoordinator::idle() {
  // dead-man switch: a lost release event must not leave dictation running
  const Settings s = settings_.snapshot();
  if (s.deadManSwitch && !recordHeld_ && dictation_.believed() && queue_.pending() == 0) {
    log_.info(kComponent, "record button not held; stopping dictation");
    enqueue(ActionRequest{ ActionKind::StopRecording, std::string(sources::kInternal) });
  }
}

void ReadingCoordinator::housekeeping() {
  const Settings s = settings_.snapshot();
  io_.presentation.ensureOverlaysOnTop();
  if (s.indicatorEnabled)
    io_.presentation.setRecordingIndicator(dictation_.snapshot().indicatorOn);
}

void ReadingCoordinator::execute(const ActionRequest& request) {
  const Settings s = settings_.snapshot();

  if (request.source == sources::kHotkey) {
    io_.desktop.emitKeystroke(Keystroke::ReleaseModifiers);
    std::this_thread::sleep_for(s.pacing.modifierRelease);
  }

  switch (request.kind) {
  case ActionKind::SystemBeep:
    dictation_.systemBeep();
    break;
  case ActionKind::ToggleRecord:
    dictation_.setRecording(std::nullopt);
    break;
  case ActionKind::StartRecording:
    dictation_.setRecording(true);
    break;
  case ActionKind::StopRecording:
    dictation_.setRecording(false);
    break;
  case ActionKind::ProcessReport:
    processReport(request, s);
    break;
  case ActionKind::SignReport:
    signReport(request, s);
    break;
  case ActionKind::DiscardStudy:
    discardStudy();
    break;
  case ActionKind::CreateImpression:
    createImpression(request);
    break;
  case ActionKind::ShowReport:
    showReport(s);
    break;
  case ActionKind::InsertMacros:
    insertMacros(s);
    break;
  case ActionKind::InsertPickListText:
    insertPickListText(s);
    break;
  case ActionKind::CreateCriticalNote:
    createCriticalNote();
    break;
  default:
    throw std::invalid_argument("[Coordinator] unknown action kind " +
                                std::to_string(static_cast<int>(request.kind)));
  }
}

// ---- action bodies --------------------------------------------------------

void ReadingCoordinator::sendKeystroke(Keystroke k, const Settings& s) {
  io_.desktop.activateExternalApp();
  std::this_thread::sleep_for(s.pacing.activation);
  io_.desktop.emitKeystroke(k);
}

void ReadingCoordinator::processReport(const ActionRequest& request, const Settings& s) {
  const bool wasRecording = dictation_.believed();
  poller_.markProcessPressed();

  if (request.source != sources::kHotkey) {
    io_.desktop.emitKeystroke(Keystroke::ReleaseModifiers);
    std::this_thread::sleep_for(s.pacing.modifierRelease);
  }

  if (s.autoStopDictation && wasRecording) {
    dictation_.setRecording(false);
    std::this_thread::sleep_for(s.pacing.autoStopSettle);
  }

  if (request.source == sources::kSkipBack &&
      s.micButtonFor(ActionKind::ProcessReport) == sources::kSkipBack && !wasRecording)
    log_.trace(kComponent, "Skip Back already processed the report; no keystroke");
  else
    sendKeystroke(Keystroke::ProcessReport, s);

  if (s.scrollToBottomOnProcess)
    smartScroll(s);

  if (s.showImpression)
    poller_.beginImpressionSearch();

  if (s.protocolAutoCreateNote && poller_.caseContext().protocolFlag)
    createCriticalNote();
}

void ReadingCoordinator::smartScroll(const Settings& s) {
  if (!s.scrapeEnabled) {
    log_.trace(kComponent, "scrape disabled; no scroll");
    return;
  }
  const std::string text = poller_.lastReport();
  if (text.empty()) {
    log_.trace(kComponent, "no report scraped yet; no scroll");
    return;
  }

  const auto lines = static_cast<int>(report::countLines(text));
  int pages = 0;
  if (lines >= s.scrollThreshold3)
    pages = 3;
  else if (lines >= s.scrollThreshold2)
    pages = 2;
  else if (lines >= s.scrollThreshold1)
    pages = 1;

  if (s.showLineCountToast)
    io_.presentation.showToast(std::to_string(lines) + " lines, " + std::to_string(pages) +
                               " page(s) down");
  if (pages == 0)
    return;

  io_.desktop.activateExternalApp();
  std::this_thread::sleep_for(s.pacing.activation);
  for (int i = 0; i < pages; ++i) {
    io_.desktop.emitKeystroke(Keystroke::PageDown);
    std::this_thread::sleep_for(s.pacing.keyRepeat);
  }
}

void ReadingCoordinator::signReport(const ActionRequest& request, const Settings& s) {
  closeReportView();
  poller_.markSigned();

  if (request.source == sources::kCheckmark &&
      s.micButtonFor(ActionKind::SignReport) == sources::kCheckmark)
    log_.trace(kComponent, "Checkmark already signed the report; no keystroke");
  else
    sendKeystroke(Keystroke::SignReport, s);

  poller_.endImpressionSearch();
}

void ReadingCoordinator::discardStudy() {
  closeReportView();
  poller_.markDiscardRequested();

  if (io_.desktop.clickDiscardStudy()) {
    io_.presentation.showToast("Study discarded");
    poller_.closeCaseAfterDiscard();
  } else {
    io_.presentation.showToast("Discard failed: control not found");
  }
  poller_.endImpressionSearch();
}

void ReadingCoordinator::createImpression(const ActionRequest& request) {
  if (request.source == sources::kSkipForward) {
    log_.trace(kComponent, "Skip Forward already created the impression");
    return;
  }
  const bool ok = io_.desktop.clickCreateImpression();
  io_.presentation.showToast(ok ? "Impression created" : "Create Impression control not found");
}

void ReadingCoordinator::showReport(const Settings& s) {
  if (poller_.reportViewOpen()) {
    closeReportView();
    return;
  }

  const std::string text = poller_.lastReport();
  if (text.empty()) {
    io_.presentation.showToast("No report available");
    return;
  }

  const CaseContext ctx = poller_.caseContext();
  std::optional<std::string> baseline;
  if (s.showReportChanges && ctx.processPressed)
    baseline = ctx.baselineReport;
  io_.presentation.showReport(text, baseline);
  poller_.setReportViewOpen(true, text);
}

void ReadingCoordinator::closeReportView() {
  if (!poller_.reportViewOpen())
    return;
  io_.presentation.hideReport();
  poller_.setReportViewOpen(false);
}

void ReadingCoordinator::insertMacros(const Settings& s) {
  const std::string text = poller_.takePendingMacroText();
  if (text.empty())
    return;
  paste_.paste(text, s);
  log_.info(kComponent, "macros inserted");
}

void ReadingCoordinator::insertPickListText(const Settings& s) {
  std::optional<PendingPick> pick;
  {
    std::lock_guard<std::mutex> lock(pickMtx_);
    pick.swap(pendingPick_);
  }
  if (!pick)
    return;

  std::string text;
  try {
    text = resolvePickListText(s, *pick);
  } catch (const InvalidReferenceError& e) {
    log_.warn(kComponent, e.what());
    io_.presentation.showBlockingNotice("Builder Not Found", e.what());
    return;
  }
  if (text.empty())
    return;
  paste_.paste(text, s);
}

std::string ReadingCoordinator::resolvePickListText(const Settings& s,
                                                    const PendingPick& pick) const {
  auto findList = [&s](const std::string& name) -> const PickList& {
    auto it = std::find_if(s.pickLists.begin(), s.pickLists.end(),
                           [&name](const PickList& l) { return l.name == name; });
    if (it == s.pickLists.end() || !it->enabled)
      throw InvalidReferenceError("The referenced builder list is not available: '" + name + "'");
    return *it;
  };

  const PickList& list = findList(pick.list);
  if (pick.index >= list.items.size())
    throw std::out_of_range("[Coordinator] pick list '" + list.name + "' has no item " +
                            std::to_string(pick.index));
  const PickListItem& item = list.items[pick.index];
  if (item.listRef.empty())
    return item.text;

  const PickList& builder = findList(item.listRef);
  std::string text = item.text;
  for (const auto& part : builder.items) {
    if (part.text.empty())
      continue;
    if (!text.empty())
      text += ' ';
    text += part.text;
  }
  return text;
}

void ReadingCoordinator::createCriticalNote() {
  const std::string accession = poller_.currentAccession();
  if (accession.empty()) {
    io_.presentation.showToast("No study open");
    return;
  }
  if (notes_.hasNoteFor(accession)) {
    log_.trace(kComponent, "critical note already exists for " + accession);
    return;
  }
  const bool ok = notes_.ensureNoteFor(accession, [this] { return io_.desktop.createCriticalNote(); });
  io_.presentation.showToast(ok ? "Critical note created for " + accession
                                : "Critical note creation failed");
}
