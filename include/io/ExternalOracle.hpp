#pragma once
/** @file  ExternalOracle.hpp
 *  @brief Read-only probes into the external reporting/worklist applications.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <optional>
#include <string>

namespace radflow {
  namespace io {

    /// One scrape of the reporting application. Empty accession means no case is open.
    struct CaseSnapshot {
      std::string accession;
      std::string reportText;
      bool drafted{ false };
      std::string templateName;
      std::string description;
      std::string patientGender; ///< "Male", "Female" or empty when unknown
    };

    /**
 * @class ExternalOracle
 * @brief Ground truth obtained by scraping.
 *
 *  * Every probe may answer "unknown" (`std::nullopt`).
 *  * Probes are not atomic with respect to each other and may lag by one poll.
 *  * Implementations may throw; callers catch at the cycle boundary.
 */
    class ExternalOracle {
    public:
      virtual ~ExternalOracle() = default;

      virtual std::optional<bool> probeRecordingActive() = 0;
      virtual std::optional<CaseSnapshot> probeCaseSnapshot() = 0;
      virtual std::optional<bool> probeDiscardDialogVisible() = 0;
      virtual std::optional<bool> probeProtocolFlag(const std::string& accession) = 0;
    };

  } // namespace io
} // namespace radflow
