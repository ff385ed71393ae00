#pragma once
/** @file  ActionRequest.hpp
 *  @brief Strong-typed action kinds and the immutable request value.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace radflow {
  namespace core {

    enum class ActionKind : std::uint8_t {
      SystemBeep,
      ToggleRecord,
      StartRecording,
      StopRecording,
      ProcessReport,
      SignReport,
      DiscardStudy,
      CreateImpression,
      ShowReport,
      InsertMacros,
      InsertPickListText,
      CreateCriticalNote,
      Count
    };
    static_assert(static_cast<std::uint8_t>(ActionKind::Count) == 12,
                  "ActionKind count changed please update kActionNames");

    /// Display names; also the keys used by `action_bindings` in the config file.
    inline constexpr std::array<std::string_view, 12> kActionNames{
      "System Beep",    "Start/Stop Recording", "Start Recording",   "Stop Recording",
      "Process Report", "Sign Report",          "Discard Study",     "Create Impression",
      "Show Report",    "Insert Macros",        "Insert Pick List Text", "Create Critical Note"
    };

    inline std::string_view toString(ActionKind kind) {
      auto idx = static_cast<std::size_t>(kind);
      return idx < kActionNames.size() ? kActionNames[idx] : std::string_view{ "Unknown" };
    }

    /// Case-sensitive lookup by display name.
    inline std::optional<ActionKind> actionFromName(std::string_view name) {
      for (std::size_t i = 0; i < kActionNames.size(); ++i) {
        if (kActionNames[i] == name)
          return static_cast<ActionKind>(i);
      }
      return std::nullopt;
    }

    /// Well-known request sources. Device buttons use their own names.
    namespace sources {
      inline constexpr std::string_view kManual = "Manual";
      inline constexpr std::string_view kHotkey = "Hotkey";
      inline constexpr std::string_view kInternal = "Internal";
      inline constexpr std::string_view kPoller = "Poller";
      inline constexpr std::string_view kSkipBack = "Skip Back";
      inline constexpr std::string_view kSkipForward = "Skip Forward";
      inline constexpr std::string_view kCheckmark = "Checkmark";
      inline constexpr std::string_view kRecordButton = "Record Button";
    } // namespace sources

    struct ActionRequest {
      ActionKind kind{ ActionKind::SystemBeep };
      std::string source{ sources::kManual };
    };

  } // namespace core
} // namespace radflow
