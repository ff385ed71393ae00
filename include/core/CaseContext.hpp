#pragma once
/** @file  CaseContext.hpp
 *  @brief State of the one live case (study) tracked by the poller.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <optional>
#include <string>

namespace radflow::core {

  /// Replaced wholesale on every accession change. Empty accession means no case.
  struct CaseContext {
    std::string accession;
    std::string description;
    bool isSigned{ false };
    bool discardRequested{ false };
    std::optional<std::string> baselineReport;
    bool needsBaseline{ false };
    bool processPressed{ false };
    bool protocolFlag{ false };
    bool criticalNoteRequested{ false }; ///< poller already queued a note action

    bool open() const { return !accession.empty(); }
  };

} // namespace radflow::core
