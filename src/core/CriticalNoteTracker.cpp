/* @file CriticalNoteTracker.cpp
 * @brief dedup of the "create critical note" side effect
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

#include "core/CriticalNoteTracker.hpp"
#include "core/Logger.hpp"

using namespace radflow::core;

CriticalNoteTracker::CriticalNoteTracker(Logger& log) : log_(log) {}

bool CriticalNoteTracker::ensureNoteFor(const std::string& accession,
                                        const std::function<bool()>& create) {
  if (accession.empty())
    return false;

  std::lock_guard<std::mutex> serial(createMtx_);
  if (hasNoteFor(accession)) {
    log_.trace("CriticalNote", "note already created for " + accession);
    return true;
  }

  bool ok = create();
  if (!ok) {
    log_.warn("CriticalNote", "note creation failed for " + accession);
    return false;
  }

  std::lock_guard<std::mutex> lock(mtx_);
  created_.insert(accession);
  log_.info("CriticalNote", "note created for " + accession);
  return true;
}

bool CriticalNoteTracker::hasNoteFor(const std::string& accession) const {
  std::lock_guard<std::mutex> lock(mtx_);
  return created_.count(accession) != 0;
}

void CriticalNoteTracker::reset() {
  std::lock_guard<std::mutex> lock(mtx_);
  created_.clear();
}
