#pragma once
/** @file  AlertState.hpp
 *  @brief Per-cycle alert conditions and the single selected alert.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <cstdint>
#include <string>

namespace radflow::core {

  /// Declaration order is presentation priority (first wins).
  enum class AlertKind : std::uint8_t { GenderMismatch, TemplateMismatch, ProtocolFlag };

  inline const char* toString(AlertKind k) {
    switch (k) {
    case AlertKind::GenderMismatch:
      return "Gender mismatch";
    case AlertKind::TemplateMismatch:
      return "Template mismatch";
    case AlertKind::ProtocolFlag:
      return "Protocol flag";
    default:
      return "Unknown";
    }
  }

  struct AlertConditions {
    bool genderMismatch{ false };
    std::string genderDetail;
    bool templateMismatch{ false };
    std::string templateDetail;
    bool protocolFlag{ false };
    std::string protocolDetail;
    bool drafted{ false }; ///< indicator only, never selected

    bool any() const { return genderMismatch || templateMismatch || protocolFlag; }
    bool operator==(const AlertConditions&) const = default;
  };

  struct Alert {
    AlertKind kind{ AlertKind::ProtocolFlag };
    std::string detail;

    bool operator==(const Alert&) const = default;
  };

} // namespace radflow::core
