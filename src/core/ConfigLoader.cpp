/* @file ConfigLoader.cpp
 * @brief JSON -> Settings mapping (snake_case keys, all optional)
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <fstream>
#include <stdexcept>

// third-party headers
#include <nlohmann/json.hpp>

// radflow headers
#include "core/ConfigLoader.hpp"

using nlohmann::json;
using namespace radflow::core;

namespace {

  template <typename T> void read(const json& j, const char* key, T& out) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null())
      return;
    try {
      out = it->get<T>();
    } catch (const json::exception& e) {
      throw std::invalid_argument(std::string("[ConfigLoader] bad value for '") + key +
                                  "': " + e.what());
    }
  }

  void readMs(const json& j, const char* key, std::chrono::milliseconds& out) {
    long long ms = out.count();
    read(j, key, ms);
    if (ms < 0)
      throw std::invalid_argument(std::string("[ConfigLoader] negative duration for '") + key + "'");
    out = std::chrono::milliseconds{ ms };
  }

  StudyCriteria parseCriteria(const json& j) {
    StudyCriteria c;
    if (j.is_object()) {
      read(j, "required_terms", c.requiredTerms);
      read(j, "any_terms", c.anyTerms);
    }
    return c;
  }

  ActionKind parseActionName(const std::string& name) {
    auto kind = actionFromName(name);
    if (!kind)
      throw std::invalid_argument("[ConfigLoader] unknown action '" + name + "'");
    return *kind;
  }

} // namespace

ConfigLoader::ConfigLoader(std::string configPath) : path_(std::move(configPath)) {}

json ConfigLoader::load() const {
  std::ifstream in(path_);
  if (!in.good())
    throw std::runtime_error("[ConfigLoader] cannot open " + path_);
  try {
    return json::parse(in);
  } catch (const json::parse_error& e) {
    throw std::runtime_error("[ConfigLoader] parse error in " + path_ + ": " + e.what());
  }
}

Settings ConfigLoader::loadSettings() const { return parseSettings(load()); }

Settings ConfigLoader::parseSettings(const json& doc) {
  if (!doc.is_object())
    throw std::invalid_argument("[ConfigLoader] top level must be an object");

  Settings s;
  read(doc, "start_beep_enabled", s.startBeepEnabled);
  read(doc, "stop_beep_enabled", s.stopBeepEnabled);
  read(doc, "start_beep_volume", s.startBeepVolume);
  read(doc, "stop_beep_volume", s.stopBeepVolume);
  read(doc, "dictation_pause_ms", s.dictationPauseMs);

  read(doc, "indicator_enabled", s.indicatorEnabled);
  readMs(doc, "dictation_sync_interval_ms", s.dictationSyncInterval);
  read(doc, "sticky_off_threshold", s.stickyOffThreshold);
  readMs(doc, "manual_toggle_lockout_ms", s.manualToggleLockout);
  read(doc, "dead_man_switch", s.deadManSwitch);
  read(doc, "auto_stop_dictation", s.autoStopDictation);
  if (s.stickyOffThreshold < 1)
    throw std::invalid_argument("[ConfigLoader] sticky_off_threshold must be >= 1");

  read(doc, "restore_focus_after_action", s.restoreFocusAfterAction);
  readMs(doc, "idle_wake_ms", s.idleWake);
  readMs(doc, "shutdown_timeout_ms", s.shutdownTimeout);

  read(doc, "scrape_enabled", s.scrapeEnabled);
  readMs(doc, "scrape_interval_ms", s.scrapeInterval);
  readMs(doc, "fast_scrape_interval_ms", s.fastScrapeInterval);
  readMs(doc, "post_impression_scrape_interval_ms", s.postImpressionScrapeInterval);
  readMs(doc, "impression_settle_ms", s.impressionSettle);
  readMs(doc, "housekeeping_interval_ms", s.housekeepingInterval);
  read(doc, "show_report_changes", s.showReportChanges);
  read(doc, "show_impression", s.showImpression);

  read(doc, "show_alert_surface", s.showAlertSurface);
  std::string mode;
  read(doc, "alert_mode", mode);
  if (!mode.empty()) {
    if (mode == "always_show")
      s.alertMode = AlertMode::AlwaysShow;
    else if (mode == "alerts_only")
      s.alertMode = AlertMode::AlertsOnly;
    else
      throw std::invalid_argument("[ConfigLoader] unknown alert_mode '" + mode + "'");
  }
  read(doc, "show_template_mismatch", s.showTemplateMismatch);
  read(doc, "gender_check_enabled", s.genderCheckEnabled);
  read(doc, "show_drafted_indicator", s.showDraftedIndicator);
  read(doc, "protocol_detection_enabled", s.protocolDetectionEnabled);
  read(doc, "protocol_detection_use_clinical_history", s.protocolDetectionUseClinicalHistory);
  read(doc, "protocol_auto_create_note", s.protocolAutoCreateNote);

  read(doc, "scroll_to_bottom_on_process", s.scrollToBottomOnProcess);
  read(doc, "scroll_threshold_1", s.scrollThreshold1);
  read(doc, "scroll_threshold_2", s.scrollThreshold2);
  read(doc, "scroll_threshold_3", s.scrollThreshold3);
  read(doc, "show_line_count_toast", s.showLineCountToast);

  read(doc, "macros_enabled", s.macrosEnabled);
  read(doc, "macros_blank_lines_before", s.macrosBlankLinesBefore);
  if (auto it = doc.find("macros"); it != doc.end() && it->is_array()) {
    for (const auto& m : *it) {
      Macro macro;
      read(m, "name", macro.name);
      read(m, "enabled", macro.enabled);
      read(m, "text", macro.text);
      if (auto c = m.find("criteria"); c != m.end())
        macro.criteria = parseCriteria(*c);
      s.macros.push_back(std::move(macro));
    }
  }

  read(doc, "pick_lists_enabled", s.pickListsEnabled);
  if (auto it = doc.find("pick_lists"); it != doc.end() && it->is_array()) {
    for (const auto& p : *it) {
      PickList list;
      read(p, "name", list.name);
      read(p, "enabled", list.enabled);
      if (auto c = p.find("criteria"); c != p.end())
        list.criteria = parseCriteria(*c);
      if (auto items = p.find("items"); items != p.end() && items->is_array()) {
        for (const auto& i : *items) {
          PickListItem item;
          read(i, "label", item.label);
          read(i, "text", item.text);
          read(i, "list_ref", item.listRef);
          list.items.push_back(std::move(item));
        }
      }
      s.pickLists.push_back(std::move(list));
    }
  }

  if (auto it = doc.find("action_bindings"); it != doc.end() && it->is_object()) {
    for (const auto& [name, binding] : it->items()) {
      ActionBinding b;
      read(binding, "hotkey", b.hotkey);
      read(binding, "mic_button", b.micButton);
      s.actionBindings[parseActionName(name)] = std::move(b);
    }
  }

  if (auto it = doc.find("pacing"); it != doc.end() && it->is_object()) {
    readMs(*it, "modifier_release_ms", s.pacing.modifierRelease);
    readMs(*it, "activation_ms", s.pacing.activation);
    readMs(*it, "clipboard_settle_ms", s.pacing.clipboardSettle);
    readMs(*it, "paste_settle_ms", s.pacing.pasteSettle);
    readMs(*it, "focus_restore_ms", s.pacing.focusRestore);
    readMs(*it, "auto_stop_settle_ms", s.pacing.autoStopSettle);
    readMs(*it, "key_repeat_ms", s.pacing.keyRepeat);
  }

  read(doc, "log_path", s.logPath);
  read(doc, "oracle_state_path", s.oracleStatePath);
  read(doc, "desktop_commands", s.desktopCommands);
  return s;
}
