#pragma once
/** @file  AudioCue.hpp
 *  @brief Tone output used for dictation start/stop feedback.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

namespace radflow::io {

  class AudioCue {
  public:
    virtual ~AudioCue() = default;

    /// @param volume  0.0 .. 1.0
    virtual void playAudioCue(int frequencyHz, int durationMs, double volume) = 0;
  };

} // namespace radflow::io
