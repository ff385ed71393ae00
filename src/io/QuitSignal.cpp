/* @file QuitSignal.cpp
 * @brief sigaction-based quit latch
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

#include "io/QuitSignal.hpp"

#include <csignal>

namespace {

  volatile std::sig_atomic_t gQuit = 0;

  extern "C" void onQuitSignal(int) { gQuit = 1; }

} // namespace

bool radflow::io::installQuitHandlers() {
  struct sigaction sa {};
  sa.sa_handler = onQuitSignal;
  sigemptyset(&sa.sa_mask);
  sa.sa_flags = 0; // no SA_RESTART
  return sigaction(SIGINT, &sa, nullptr) == 0 && sigaction(SIGTERM, &sa, nullptr) == 0;
}

bool radflow::io::quitRequested() { return gQuit != 0; }

void radflow::io::resetQuitRequest() { gQuit = 0; }
