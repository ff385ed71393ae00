#pragma once
/** @file  StudyPoller.hpp
 *  @brief Periodic case-lifecycle reconciliation against scraped report state.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <chrono>
#include <functional>
#include <mutex>
#include <optional>
#include <string>

#include "core/AlertState.hpp"
#include "core/CaseContext.hpp"
#include "core/Clock.hpp"
#include "core/ImpressionSearch.hpp"
#include "core/Settings.hpp"

namespace radflow {
  namespace io {
    class ExternalOracle;
    class Presentation;
    class StudyEventSink;
    struct CaseSnapshot;
  } // namespace io

  namespace core {

    class ActionQueue;
    class AlertArbitrator;
    class CriticalNoteTracker;
    class Logger;
    class SettingsStore;

    /**
 * @class StudyPoller
 * @brief One `tick()` per poll interval.
 *
 *  * A cycle runs only if the action execution gate is free; otherwise it is
 *    skipped, not queued.
 *  * All probes complete before any state is touched. An unknown snapshot or a
 *    throwing probe abandons the cycle.
 *  * Exactly one terminal notification per case, on accession change (or
 *    immediately from `closeCaseAfterDiscard()`).
 *  * The desired poll interval (normal / fast / post-impression) is reported
 *    through the interval listener whenever it changes.
 */
    class StudyPoller {
    public:
      StudyPoller(io::ExternalOracle& oracle, io::Presentation& presentation,
                  io::StudyEventSink& events, ActionQueue& queue, AlertArbitrator& alerts,
                  CriticalNoteTracker& notes, SettingsStore& settings, Logger& log,
                  const Clock& clock);

      void tick();

      void setIntervalListener(std::function<void(std::chrono::milliseconds)> listener);
      std::chrono::milliseconds desiredInterval() const;

      // ---- hooks called from action bodies (worker thread) ----
      void markProcessPressed();
      void markSigned();
      void markDiscardRequested();
      /// Emits ClosedUnsigned now and forgets the case so no second notification follows.
      void closeCaseAfterDiscard();
      void beginImpressionSearch();
      void endImpressionSearch();
      void setReportViewOpen(bool open, const std::string& shownText = {});
      std::string takePendingMacroText();

      // ---- queries ----
      bool isCaseOpen() const;
      std::string currentAccession() const;
      CaseContext caseContext() const;
      std::string lastReport() const;
      std::optional<std::string> baseline() const;
      bool reportViewOpen() const;
      ImpressionMode impressionMode() const;

    private:
      void runCycle(const Settings& s);
      void applyCycle(const io::CaseSnapshot& snap, bool discardVisible,
                      std::optional<bool> protocolFlag, const Settings& s);
      std::string effectiveAccession(const std::string& scraped) const;
      void resetCase();
      void openCase(const io::CaseSnapshot& snap, std::optional<bool> protocolFlag,
                    const Settings& s);
      void queueMacros(const Settings& s);
      AlertConditions evaluateAlerts(const io::CaseSnapshot& snap, const Settings& s) const;
      void stepImpression(const io::CaseSnapshot& snap, const Settings& s);
      std::optional<std::string> viewBaseline(const Settings& s) const;
      void publishInterval(const Settings& s);
      std::chrono::milliseconds intervalFor(const Settings& s) const;

      io::ExternalOracle& oracle_;
      io::Presentation& presentation_;
      io::StudyEventSink& events_;
      ActionQueue& queue_;
      AlertArbitrator& alerts_;
      CriticalNoteTracker& notes_;
      SettingsStore& settings_;
      Logger& log_;

      mutable std::mutex mtx_;
      CaseContext case_;
      std::string lastReport_;
      std::string discardedAccession_;
      ImpressionSearch search_;
      std::string impressionShown_;
      bool reportViewOpen_{ false };
      std::string reportViewText_;
      std::string pendingMacroAccession_;
      std::string pendingMacroDescription_;
      std::string pendingMacroText_;
      std::function<void(std::chrono::milliseconds)> intervalListener_;
      std::optional<std::chrono::milliseconds> publishedInterval_;
    };

  } // namespace core
} // namespace radflow
