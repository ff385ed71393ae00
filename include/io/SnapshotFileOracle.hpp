#pragma once
/** @file  SnapshotFileOracle.hpp
 *  @brief ExternalOracle backed by a JSON state file written by an external scraper.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <atomic>
#include <optional>
#include <string>

#include <nlohmann/json_fwd.hpp>

#include "io/ExternalOracle.hpp"

namespace radflow {
  namespace core {
    class Logger;
  } // namespace core

  namespace io {

    /**
 * @class SnapshotFileOracle
 * @brief Re-reads the state file on every probe.
 *
 * Layout (every key optional; a missing key or null is "unknown"):
 * @code
 * { "recording": true,
 *   "case": { "accession": "A1", "report_text": "...", "drafted": false,
 *             "template_name": "CT HEAD", "description": "CT HEAD WO",
 *             "patient_gender": "Female" },
 *   "discard_dialog_visible": false,
 *   "protocol_flags": { "A1": true } }
 * @endcode
 * A missing or malformed file makes every probe unknown.
 */
    class SnapshotFileOracle : public ExternalOracle {
    public:
      SnapshotFileOracle(std::string path, core::Logger& log);

      std::optional<bool> probeRecordingActive() override;
      std::optional<CaseSnapshot> probeCaseSnapshot() override;
      std::optional<bool> probeDiscardDialogVisible() override;
      std::optional<bool> probeProtocolFlag(const std::string& accession) override;

      /// Parses one document; throws nlohmann::json::exception on wrong types.
      static std::optional<CaseSnapshot> parseCase(const nlohmann::json& doc);

    private:
      std::optional<nlohmann::json> read();

      std::string path_;
      core::Logger& log_;
      std::atomic<bool> warned_{ false }; ///< probed from the dictation and poll timers
    };

  } // namespace io
} // namespace radflow
