#pragma once
/** @file  ReadingCoordinator.hpp
 *  @brief Top-level orchestrator: owns the queue, reconcilers, timers and action bodies.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <atomic>
#include <chrono>
#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "core/ActionQueue.hpp"
#include "core/AlertArbitrator.hpp"
#include "core/Clock.hpp"
#include "core/CriticalNoteTracker.hpp"
#include "core/DelayQueue.hpp"
#include "core/DictationReconciler.hpp"
#include "core/PasteGuard.hpp"
#include "core/PeriodicTimer.hpp"
#include "core/Settings.hpp"
#include "core/StudyPoller.hpp"
#include "io/DesktopCommander.hpp"

namespace radflow {
  namespace io {
    class AudioCue;
    class ExternalOracle;
    class Presentation;
    class StudyEventSink;
  } // namespace io

  namespace core {

    class ErrorMonitor;
    class Logger;
    class SettingsStore;

    /**
 * @class ReadingCoordinator
 * @brief Replaces the old global controller state with one owning object.
 *
 *  * Lifecycle: construct -> `start()` -> ... -> `stop()` (also from the dtor).
 *  * Device buttons and hotkeys are mapped through `Settings::actionBindings`.
 *  * Every action body runs on the ActionQueue worker; poll and dictation
 *    sync run on their own timers.
 *  * Without `start()` the host can step everything by hand
 *    (`drainPending()`, `pollNow()`, `syncDictationNow()`).
 */
    class ReadingCoordinator {
    public:
      struct Collaborators {
        io::ExternalOracle& oracle;
        io::DesktopCommander& desktop;
        io::AudioCue& audio;
        io::Presentation& presentation;
        io::StudyEventSink& events;
      };

      /// @param deferrer  nullptr -> an internal DelayQueue thread
      /// @param clock     nullptr -> steady_clock
      ReadingCoordinator(Collaborators io, SettingsStore& settings, Logger& log,
                         ErrorMonitor& errors, Deferrer* deferrer = nullptr,
                         const Clock* clock = nullptr);
      ~ReadingCoordinator();

      void start();
      void stop();

      void enqueue(ActionRequest request);

      /// Swap settings and re-arm the timers.
      void applySettings(Settings next);

      // ---- event entry points ----
      bool onDeviceButton(const std::string& button);
      bool onHotkey(const std::string& hotkey);
      void onRecordButtonState(bool pressed);
      void selectPickListItem(const std::string& listName, std::size_t index);

      // ---- queries ----
      bool isCaseOpen() const;
      std::string currentAccession() const;
      bool hasCriticalNoteFor(const std::string& accession) const;
      bool recordingBelieved() const;
      /// Enabled pick lists whose criteria match the open study.
      std::vector<std::string> availablePickLists() const;

      // ---- manual stepping ----
      std::size_t drainPending();
      void pollNow();
      void syncDictationNow();
      void housekeepingNow();

      StudyPoller& poller() { return poller_; }
      DictationReconciler& dictation() { return dictation_; }
      ActionQueue& queue() { return queue_; }

      ReadingCoordinator(const ReadingCoordinator&) = delete;
      ReadingCoordinator& operator=(const ReadingCoordinator&) = delete;

    private:
      struct PendingPick {
        std::string list;
        std::size_t index{ 0 };
      };

      void prepare(const ActionRequest& request);
      void execute(const ActionRequest& request);
      void cleanup(const ActionRequest& request);
      void idle();
      void housekeeping();

      void processReport(const ActionRequest& request, const Settings& s);
      void smartScroll(const Settings& s);
      void signReport(const ActionRequest& request, const Settings& s);
      void discardStudy();
      void createImpression(const ActionRequest& request);
      void showReport(const Settings& s);
      void closeReportView();
      void insertMacros(const Settings& s);
      void insertPickListText(const Settings& s);
      void createCriticalNote();
      void sendKeystroke(io::Keystroke k, const Settings& s);

      std::string resolvePickListText(const Settings& s, const PendingPick& pick) const;

      Collaborators io_;
      SettingsStore& settings_;
      Logger& log_;
      ErrorMonitor& errors_;

      Clock defaultClock_;
      const Clock& clock_;
      std::unique_ptr<DelayQueue> ownDelay_;
      Deferrer& deferrer_;

      CriticalNoteTracker notes_;
      AlertArbitrator alerts_;
      PasteGuard paste_;
      ActionQueue queue_;
      DictationReconciler dictation_;
      StudyPoller poller_;

      std::unique_ptr<PeriodicTimer> syncTimer_;
      std::unique_ptr<PeriodicTimer> pollTimer_;
      std::unique_ptr<PeriodicTimer> housekeepingTimer_;

      std::mutex pickMtx_;
      std::optional<PendingPick> pendingPick_;
      std::atomic<bool> recordHeld_{ false };
      std::atomic<bool> started_{ false };
    };

  } // namespace core
} // namespace radflow
