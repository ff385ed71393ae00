/* @file ShellCommander.cpp
 * @brief fork/exec + popen based desktop automation
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <array>
#include <cerrno>
#include <cstdio>
#include <cstring> // for strerror
#include <stdexcept>

// Linux headers
#include <sys/wait.h>
#include <unistd.h>

// radflow headers
#include "core/Logger.hpp"
#include "io/ShellCommander.hpp"

using namespace radflow::io;

namespace {
  constexpr std::string_view kComponent = "ShellCommander";
}

ShellCommander::ShellCommander(std::map<std::string, std::string> commands, core::Logger& log)
    : commands_(std::move(commands)), log_(log) {}

const std::string* ShellCommander::find(const std::string& key) const {
  auto it = commands_.find(key);
  if (it == commands_.end() || it->second.empty())
    return nullptr;
  return &it->second;
}

const std::string& ShellCommander::require(const std::string& key) const {
  if (const auto* cmd = find(key))
    return *cmd;
  throw std::runtime_error("[ShellCommander] no command configured for '" + key + "'");
}

int ShellCommander::run(const std::string& command) {
  pid_t pid = ::fork();
  if (pid < 0)
    throw std::runtime_error(std::string("[ShellCommander] fork failed: ") + strerror(errno));
  if (pid == 0) {
    ::execl("/bin/sh", "sh", "-c", command.c_str(), static_cast<char*>(nullptr));
    ::_exit(127);
  }

  int status = 0;
  while (::waitpid(pid, &status, 0) < 0) {
    if (errno != EINTR)
      throw std::runtime_error(std::string("[ShellCommander] waitpid failed: ") + strerror(errno));
  }
  return WIFEXITED(status) ? WEXITSTATUS(status) : -1;
}

void ShellCommander::runChecked(const std::string& key) {
  const std::string& cmd = require(key);
  int rc = run(cmd);
  if (rc != 0)
    throw std::runtime_error("[ShellCommander] '" + key + "' exited with " + std::to_string(rc));
  log_.trace(kComponent, key);
}

bool ShellCommander::runStatus(const std::string& key) {
  const auto* cmd = find(key);
  if (!cmd) {
    log_.warn(kComponent, "no command configured for '" + key + "'");
    return false;
  }
  int rc = run(*cmd);
  log_.trace(kComponent, key + " -> " + std::to_string(rc));
  return rc == 0;
}

void ShellCommander::emitKeystroke(Keystroke k) {
  runChecked(std::string("keystroke.") + toString(k));
}

void ShellCommander::activateExternalApp() { runChecked("activate"); }

void ShellCommander::setClipboardText(const std::string& text) {
  const std::string& cmd = require("set_clipboard");
  FILE* pipe = ::popen(cmd.c_str(), "w");
  if (!pipe)
    throw std::runtime_error(std::string("[ShellCommander] popen failed: ") + strerror(errno));
  std::size_t written = std::fwrite(text.data(), 1, text.size(), pipe);
  int rc = ::pclose(pipe);
  if (written != text.size() || rc != 0)
    throw std::runtime_error("[ShellCommander] set_clipboard failed (rc " + std::to_string(rc) + ")");
}

std::optional<std::string> ShellCommander::getClipboardText() {
  const auto* cmd = find("get_clipboard");
  if (!cmd)
    return std::nullopt;
  FILE* pipe = ::popen(cmd->c_str(), "r");
  if (!pipe) {
    log_.warn(kComponent, std::string("popen failed: ") + strerror(errno));
    return std::nullopt;
  }
  std::string out;
  std::array<char, 4096> buf{};
  std::size_t n;
  while ((n = std::fread(buf.data(), 1, buf.size(), pipe)) > 0)
    out.append(buf.data(), n);
  if (::pclose(pipe) != 0)
    return std::nullopt;
  return out;
}

void ShellCommander::saveFocus() {
  if (find("save_focus"))
    runChecked("save_focus");
}

void ShellCommander::restoreFocus() {
  if (find("restore_focus"))
    runChecked("restore_focus");
}

bool ShellCommander::clickDiscardStudy() { return runStatus("click_discard_study"); }

bool ShellCommander::clickCreateImpression() { return runStatus("click_create_impression"); }

bool ShellCommander::createCriticalNote() { return runStatus("create_critical_note"); }
