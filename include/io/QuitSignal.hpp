#pragma once
/** @file  QuitSignal.hpp
 *  @brief SIGINT/SIGTERM latch for the console host.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

namespace radflow {
  namespace io {

    /**
 * Installs handlers for SIGINT and SIGTERM that set the quit latch.
 *
 * The handlers are installed without `SA_RESTART`, so a read blocked on stdin
 * returns with `EINTR` and the command loop can see the latch.
 * @returns false if either `sigaction` call failed.
 */
    bool installQuitHandlers();

    /// True once SIGINT or SIGTERM arrived.
    bool quitRequested();

    /// Clears the latch.
    void resetQuitRequest();

  } // namespace io
} // namespace radflow
