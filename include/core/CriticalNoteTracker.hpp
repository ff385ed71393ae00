#pragma once
/** @file  CriticalNoteTracker.hpp
 *  @brief At-most-once critical note per accession.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <functional>
#include <mutex>
#include <string>
#include <unordered_set>

namespace radflow::core {

  class Logger;

  /**
 * @class CriticalNoteTracker
 * @brief Remembers which accessions already have a note in this case.
 *
 *  * `ensureNoteFor()` runs the side effect only for a non-empty accession that
 *    has no recorded note. The accession is recorded only when the side effect
 *    reports success, so a failed creation can be retried.
 *  * Cleared by `reset()` on accession change, nowhere else.
 */
  class CriticalNoteTracker {
  public:
    explicit CriticalNoteTracker(Logger& log);

    /// @return true when a note exists for \p accession after the call.
    bool ensureNoteFor(const std::string& accession, const std::function<bool()>& create);

    bool hasNoteFor(const std::string& accession) const;

    void reset();

  private:
    Logger& log_;
    mutable std::mutex mtx_;   ///< guards created_
    std::mutex createMtx_;     ///< serializes ensureNoteFor() callers
    std::unordered_set<std::string> created_;
  };

} // namespace radflow::core
