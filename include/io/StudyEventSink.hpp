#pragma once
/** @file  StudyEventSink.hpp
 *  @brief Terminal notification consumer (productivity counter, audit trail).
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <string>

namespace radflow::io {

  enum class StudyOutcome { Signed, ClosedUnsigned };

  inline const char* toString(StudyOutcome o) {
    return o == StudyOutcome::Signed ? "SIGNED" : "CLOSED_UNSIGNED";
  }

  class StudyEventSink {
  public:
    virtual ~StudyEventSink() = default;

    /// Exactly once per case, when the case is left.
    virtual void onStudyClosed(const std::string& accession, StudyOutcome outcome) = 0;
  };

} // namespace radflow::io
