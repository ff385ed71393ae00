#pragma once
/** @file  DictationReconciler.hpp
 *  @brief Keeps the "recording" belief in sync with the external dictation state.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <cstdint>
#include <mutex>
#include <optional>

#include "core/Clock.hpp"
#include "core/Settings.hpp"

namespace radflow {
  namespace io {
    class AudioCue;
    class DesktopCommander;
    class ExternalOracle;
    class Presentation;
  } // namespace io

  namespace core {

    class Deferrer;
    class Logger;
    class SettingsStore;

    struct DictationState {
      bool believed{ false };
      int consecutiveFalseReads{ 0 };
      std::optional<Clock::time_point> lastManualToggle;
      bool indicatorOn{ false };
    };

    /**
 * @class DictationReconciler
 * @brief Instant-on / sticky-off debounce plus the manual toggle.
 *
 *  * `syncTick()` (timer): unknown read -> nothing; true read -> on at once;
 *    false reads -> off after `stickyOffThreshold` in a row. Writes to the
 *    belief are suppressed for `manualToggleLockout` after a manual toggle;
 *    the indicator follows the debounced reading regardless.
 *  * `setRecording()` (action worker): toggles the external dictation and
 *    predicts the new state; skips the keystroke when already there.
 *  * `systemBeep()` (action worker): flips the belief without a keystroke and
 *    schedules a reality check that may only correct the belief to on.
 */
    class DictationReconciler {
    public:
      DictationReconciler(io::ExternalOracle& oracle, io::DesktopCommander& desktop,
                          io::AudioCue& audio, io::Presentation& presentation, Deferrer& deferrer,
                          SettingsStore& settings, Logger& log, const Clock& clock);

      void syncTick();

      /// @param desired  nullopt toggles; a value drives towards that state
      void setRecording(std::optional<bool> desired);

      void systemBeep();

      bool believed() const;
      DictationState snapshot() const;

      static constexpr int kStartCueHz = 1000;
      static constexpr int kStopCueHz = 500;
      static constexpr int kCueDurationMs = 200;

    private:
      void playCue(bool starting, const Settings& settings);
      void pushIndicator(bool on, const Settings& settings);
      void realityCheck(std::uint64_t token);
      std::optional<bool> probe();

      io::ExternalOracle& oracle_;
      io::DesktopCommander& desktop_;
      io::AudioCue& audio_;
      io::Presentation& presentation_;
      Deferrer& deferrer_;
      SettingsStore& settings_;
      Logger& log_;
      const Clock& clock_;

      mutable std::mutex mtx_;
      DictationState state_;
      std::optional<bool> indicatorShown_;
      std::uint64_t beepToken_{ 0 };
    };

  } // namespace core
} // namespace radflow
