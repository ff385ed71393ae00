#pragma once
/** @file  Settings.hpp
 *  @brief Immutable settings snapshot consumed by every subsystem.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <chrono>
#include <map>
#include <string>
#include <vector>

#include "core/ActionRequest.hpp"

namespace radflow {
  namespace core {

    using std::chrono::milliseconds;

    /// How the alert surface behaves (see AlertArbitrator).
    enum class AlertMode { AlwaysShow, AlertsOnly };

    /// Hotkey and device button an action is bound to; either may be empty.
    struct ActionBinding {
      std::string hotkey;
      std::string micButton;
    };

    /// Study filter shared by macros and pick lists. Empty filter matches every study.
    struct StudyCriteria {
      std::vector<std::string> requiredTerms; ///< all must appear in the description
      std::vector<std::string> anyTerms;      ///< at least one must appear (if non-empty)

      bool matches(const std::string& description) const;
    };

    struct Macro {
      std::string name;
      bool enabled{ true };
      StudyCriteria criteria;
      std::string text;
    };

    struct PickListItem {
      std::string label;
      std::string text;
      std::string listRef; ///< non-empty: item expands to another pick list
    };

    struct PickList {
      std::string name;
      bool enabled{ true };
      StudyCriteria criteria;
      std::vector<PickListItem> items;
    };

    /// Fixed settle sleeps inside action bodies. Tests zero them.
    struct Pacing {
      milliseconds modifierRelease{ 50 };
      milliseconds activation{ 100 };
      milliseconds clipboardSettle{ 50 };
      milliseconds pasteSettle{ 100 };
      milliseconds focusRestore{ 50 };
      milliseconds autoStopSettle{ 200 };
      milliseconds keyRepeat{ 30 };
    };

    struct Settings {
      // --- dictation feedback ---
      bool startBeepEnabled{ true };
      bool stopBeepEnabled{ true };
      double startBeepVolume{ 0.04 };
      double stopBeepVolume{ 0.04 };
      int dictationPauseMs{ 1000 };

      // --- dictation reconciler ---
      bool indicatorEnabled{ true };
      milliseconds dictationSyncInterval{ 250 };
      int stickyOffThreshold{ 3 };
      milliseconds manualToggleLockout{ 500 };
      bool deadManSwitch{ false };
      bool autoStopDictation{ false };

      // --- action loop ---
      bool restoreFocusAfterAction{ true };
      milliseconds idleWake{ 500 };
      milliseconds shutdownTimeout{ 500 };

      // --- study poller ---
      bool scrapeEnabled{ true };
      milliseconds scrapeInterval{ 3000 };
      milliseconds fastScrapeInterval{ 1000 };
      milliseconds postImpressionScrapeInterval{ 3000 };
      milliseconds impressionSettle{ 2000 };
      milliseconds housekeepingInterval{ 5000 };
      bool showReportChanges{ false };
      bool showImpression{ false };

      // --- alerts ---
      bool showAlertSurface{ false };
      AlertMode alertMode{ AlertMode::AlertsOnly };
      bool showTemplateMismatch{ false };
      bool genderCheckEnabled{ false };
      bool showDraftedIndicator{ false };
      bool protocolDetectionEnabled{ false };
      bool protocolDetectionUseClinicalHistory{ false };
      bool protocolAutoCreateNote{ false };

      // --- smart scroll ---
      bool scrollToBottomOnProcess{ false };
      int scrollThreshold1{ 10 };
      int scrollThreshold2{ 30 };
      int scrollThreshold3{ 50 };
      bool showLineCountToast{ false };

      // --- text insertion ---
      bool macrosEnabled{ false };
      bool macrosBlankLinesBefore{ false };
      std::vector<Macro> macros;
      bool pickListsEnabled{ true };
      std::vector<PickList> pickLists;

      std::map<ActionKind, ActionBinding> actionBindings;
      Pacing pacing;

      // --- headless console front end ---
      std::string logPath{ "radflow.log" };
      std::string oracleStatePath{ "radflow-state.json" };
      std::map<std::string, std::string> desktopCommands; ///< command name -> shell line

      /// Button currently bound to \p kind, or empty.
      const std::string& micButtonFor(ActionKind kind) const;
    };

  } // namespace core
} // namespace radflow
