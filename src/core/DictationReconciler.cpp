/* @file DictationReconciler.cpp
 * @brief debounced dictation belief, manual toggle and beep reality check
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <exception>
#include <thread>

// radflow headers
#include "core/DelayQueue.hpp"
#include "core/DictationReconciler.hpp"
#include "core/Logger.hpp"
#include "core/SettingsStore.hpp"
#include "io/AudioCue.hpp"
#include "io/DesktopCommander.hpp"
#include "io/ExternalOracle.hpp"
#include "io/Presentation.hpp"

using namespace radflow::core;

namespace {
  constexpr std::string_view kComponent = "Dictation";
  constexpr std::chrono::milliseconds kMinRealityCheckDelay{ 1500 };
} // namespace

DictationReconciler::DictationReconciler(io::ExternalOracle& oracle, io::DesktopCommander& desktop,
                                         io::AudioCue& audio, io::Presentation& presentation,
                                         Deferrer& deferrer, SettingsStore& settings, Logger& log,
                                         const Clock& clock)
    : oracle_(oracle), desktop_(desktop), audio_(audio), presentation_(presentation),
      deferrer_(deferrer), settings_(settings), log_(log), clock_(clock) {}

std::optional<bool> DictationReconciler::probe() {
  try {
    return oracle_.probeRecordingActive();
  } catch (const std::exception& e) {
    log_.warn(kComponent, std::string("recording probe failed: ") + e.what());
    return std::nullopt;
  }
}

void DictationReconciler::syncTick() {
  const Settings s = settings_.snapshot();
  auto reading = probe();
  if (!reading)
    return;

  bool indicator;
  {
    std::lock_guard<std::mutex> lock(mtx_);
    const bool locked = state_.lastManualToggle &&
                        clock_.now() - *state_.lastManualToggle < s.manualToggleLockout;
    if (*reading) {
      state_.consecutiveFalseReads = 0;
      state_.indicatorOn = true;
      if (!locked && !state_.believed) {
        state_.believed = true;
        log_.trace(kComponent, "oracle reports recording; belief on");
      }
    } else {
      ++state_.consecutiveFalseReads;
      if (state_.consecutiveFalseReads >= s.stickyOffThreshold) {
        state_.indicatorOn = false;
        if (!locked && state_.believed) {
          state_.believed = false;
          log_.trace(kComponent, "sticky-off threshold reached; belief off");
        }
      }
    }
    indicator = state_.indicatorOn;
  }
  pushIndicator(indicator, s);
}

void DictationReconciler::setRecording(std::optional<bool> desired) {
  const Settings s = settings_.snapshot();
  {
    std::lock_guard<std::mutex> lock(mtx_);
    state_.lastManualToggle = clock_.now();
  }

  const auto actual = probe();
  const bool current = actual.value_or(believed());
  if (desired && current == *desired) {
    log_.info(kComponent, std::string("already ") + (*desired ? "recording" : "stopped") +
                              "; no keystroke");
    {
      std::lock_guard<std::mutex> lock(mtx_);
      state_.believed = current;
      state_.consecutiveFalseReads = 0;
      state_.indicatorOn = current;
    }
    playCue(*desired, s);
    pushIndicator(current, s);
    return;
  }

  const bool target = desired ? *desired : !current;

  desktop_.activateExternalApp();
  std::this_thread::sleep_for(s.pacing.activation);
  desktop_.emitKeystroke(io::Keystroke::ToggleRecord);

  {
    std::lock_guard<std::mutex> lock(mtx_);
    state_.believed = target;
    state_.consecutiveFalseReads = 0;
    state_.indicatorOn = target;
  }
  log_.info(kComponent, std::string("toggled dictation ") + (target ? "on" : "off"));
  playCue(target, s);
  pushIndicator(target, s);
}

void DictationReconciler::systemBeep() {
  const Settings s = settings_.snapshot();
  bool next;
  std::uint64_t token;
  {
    std::lock_guard<std::mutex> lock(mtx_);
    state_.believed = !state_.believed;
    state_.consecutiveFalseReads = 0;
    state_.lastManualToggle = clock_.now();
    state_.indicatorOn = state_.believed;
    next = state_.believed;
    token = ++beepToken_;
  }
  playCue(next, s);
  pushIndicator(next, s);

  const auto delay = std::max(kMinRealityCheckDelay,
                              std::chrono::milliseconds{ s.dictationPauseMs * 5 / 2 });
  deferrer_.runAfter(delay, [this, token] { realityCheck(token); });
}

void DictationReconciler::realityCheck(std::uint64_t token) {
  {
    std::lock_guard<std::mutex> lock(mtx_);
    if (token != beepToken_)
      return; // a newer beep owns the check
  }
  auto reading = probe();
  if (!reading || !*reading)
    return;

  const Settings s = settings_.snapshot();
  {
    std::lock_guard<std::mutex> lock(mtx_);
    if (token != beepToken_ || state_.believed)
      return;
    state_.believed = true;
    state_.consecutiveFalseReads = 0;
    state_.indicatorOn = true;
  }
  log_.info(kComponent, "reality check: oracle is recording, belief corrected to on");
  pushIndicator(true, s);
}

bool DictationReconciler::believed() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return state_.believed;
}

DictationState DictationReconciler::snapshot() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return state_;
}

void DictationReconciler::playCue(bool starting, const Settings& s) {
  if (starting) {
    if (!s.startBeepEnabled)
      return;
    const double volume = s.startBeepVolume;
    deferrer_.runAfter(std::chrono::milliseconds{ s.dictationPauseMs }, [this, volume] {
      audio_.playAudioCue(kStartCueHz, kCueDurationMs, volume);
    });
  } else if (s.stopBeepEnabled) {
    audio_.playAudioCue(kStopCueHz, kCueDurationMs, s.stopBeepVolume);
  }
}

void DictationReconciler::pushIndicator(bool on, const Settings& s) {
  if (!s.indicatorEnabled)
    return;
  {
    std::lock_guard<std::mutex> lock(mtx_);
    if (indicatorShown_ && *indicatorShown_ == on)
      return;
    indicatorShown_ = on;
  }
  presentation_.setRecordingIndicator(on);
}
