/* @file ImpressionSearch.cpp
 * @brief impression search mode transitions
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

#include "core/ImpressionSearch.hpp"

using namespace radflow::core;

const char* radflow::core::toString(ImpressionMode mode) {
  switch (mode) {
  case ImpressionMode::Fast:
    return "Fast";
  case ImpressionMode::Found:
    return "Found";
  default:
    return "Idle";
  }
}

void ImpressionSearch::begin() {
  mode_ = ImpressionMode::Fast;
  startedAt_ = clock_.now();
  // an auto-shown surface becomes the pinned one
  autoShown_ = false;
}

void ImpressionSearch::end() {
  mode_ = ImpressionMode::Idle;
  autoShown_ = false;
}

ImpressionSearch::Step ImpressionSearch::step(const std::string& impression, bool drafted,
                                              std::chrono::milliseconds settle) {
  switch (mode_) {
  case ImpressionMode::Fast:
    if (!impression.empty() && clock_.now() - startedAt_ >= settle) {
      mode_ = ImpressionMode::Found;
      return Step::Found;
    }
    return Step::None;

  case ImpressionMode::Found:
    return impression.empty() ? Step::None : Step::RefreshPinned;

  case ImpressionMode::Idle:
    if (drafted && !impression.empty()) {
      if (autoShown_)
        return Step::RefreshPinned;
      autoShown_ = true;
      return Step::AutoShow;
    }
    if (!drafted && autoShown_) {
      autoShown_ = false;
      return Step::AutoHide;
    }
    return Step::None;
  }
  return Step::None;
}
