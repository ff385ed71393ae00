/* @file main.cpp
 * @brief headless console front end: config, logger, coordinator and a stdin command loop
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <exception>
#include <iostream>
#include <sstream>
#include <string>

// radflow headers
#include "core/ConfigLoader.hpp"
#include "core/ErrorMonitor.hpp"
#include "core/Logger.hpp"
#include "core/ReadingCoordinator.hpp"
#include "core/SettingsStore.hpp"
#include "io/ConsolePresenter.hpp"
#include "io/QuitSignal.hpp"
#include "io/ShellCommander.hpp"
#include "io/SnapshotFileOracle.hpp"

using namespace radflow;

namespace {

  void printHelp() {
    std::cout << "commands:\n"
                 "  action <name>          enqueue an action by display name\n"
                 "  button <name>          device button press (mapped through bindings)\n"
                 "  hotkey <combo>         hotkey press (mapped through bindings)\n"
                 "  record down|up         record button state\n"
                 "  pick <list> <index>    insert a pick list item\n"
                 "  picklists              pick lists for the open study\n"
                 "  status                 open case and dictation belief\n"
                 "  reload                 re-read the config file\n"
                 "  quit\n";
  }

  core::Settings loadOrDefault(const core::ConfigLoader& loader, core::Logger& log) {
    try {
      return loader.loadSettings();
    } catch (const std::exception& e) {
      log.error("main", std::string("config not loaded, using defaults: ") + e.what());
      return core::Settings{};
    }
  }

} // namespace

int main(int argc, char** argv) {
  const std::string configPath = argc > 1 ? argv[1] : "config/radflow.json";

  core::Logger log;
  log.setEcho(true);
  core::ConfigLoader loader(configPath);
  core::SettingsStore settings(loadOrDefault(loader, log));

  const core::Settings initial = settings.snapshot();
  log.startNewRun(initial.logPath);
  log.setEcho(false);
  log.info("main", "config " + configPath);

  core::ErrorMonitor errors;
  io::SnapshotFileOracle oracle(initial.oracleStatePath, log);
  io::ShellCommander desktop(initial.desktopCommands, log);
  io::ConsolePresenter console(std::cout, log);

  core::ReadingCoordinator coordinator({ oracle, desktop, console, console, console }, settings, log,
                                       errors);

  if (!io::installQuitHandlers())
    log.warn("main", "signal handlers not installed; use 'quit' to exit");

  coordinator.start();
  printHelp();

  std::string input;
  while (!io::quitRequested() && std::getline(std::cin, input)) {
    std::istringstream in(input);
    std::string cmd;
    in >> cmd;
    std::string rest;
    std::getline(in >> std::ws, rest);

    if (cmd.empty()) {
      continue;
    } else if (cmd == "quit" || cmd == "exit") {
      break;
    } else if (cmd == "action") {
      auto kind = core::actionFromName(rest);
      if (kind)
        coordinator.enqueue(core::ActionRequest{ *kind, std::string(core::sources::kManual) });
      else
        std::cout << "unknown action '" << rest << "'\n";
    } else if (cmd == "button") {
      if (!coordinator.onDeviceButton(rest))
        std::cout << "button '" << rest << "' is not mapped\n";
    } else if (cmd == "hotkey") {
      if (!coordinator.onHotkey(rest))
        std::cout << "hotkey '" << rest << "' is not mapped\n";
    } else if (cmd == "record") {
      coordinator.onRecordButtonState(rest == "down");
    } else if (cmd == "pick") {
      auto split = rest.rfind(' ');
      if (split == std::string::npos) {
        std::cout << "usage: pick <list> <index>\n";
        continue;
      }
      try {
        coordinator.selectPickListItem(rest.substr(0, split), std::stoul(rest.substr(split + 1)));
      } catch (const std::logic_error& e) {
        std::cout << "bad index: " << e.what() << "\n";
      }
    } else if (cmd == "picklists") {
      for (const auto& name : coordinator.availablePickLists())
        std::cout << "  " << name << "\n";
    } else if (cmd == "status") {
      std::cout << "case: " << (coordinator.isCaseOpen() ? coordinator.currentAccession() : "(none)")
                << "  recording: " << (coordinator.recordingBelieved() ? "yes" : "no") << "\n";
    } else if (cmd == "reload") {
      try {
        coordinator.applySettings(loader.loadSettings());
      } catch (const std::exception& e) {
        std::cout << "reload failed: " << e.what() << "\n";
        log.warn("main", std::string("reload failed: ") + e.what());
      }
    } else {
      printHelp();
    }
  }

  coordinator.stop();
  log.info("main", "shutdown");
  log.finishRun();
  return 0;
}
