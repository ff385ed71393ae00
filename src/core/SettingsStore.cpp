/* @file SettingsStore.cpp
 * @brief settings snapshot holder + study criteria matching
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <cctype>

// radflow headers
#include "core/SettingsStore.hpp"

using namespace radflow::core;

namespace {

  std::string upper(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return s;
  }

} // namespace

bool StudyCriteria::matches(const std::string& description) const {
  const std::string desc = upper(description);
  for (const auto& term : requiredTerms) {
    if (desc.find(upper(term)) == std::string::npos)
      return false;
  }
  if (anyTerms.empty())
    return true;
  return std::any_of(anyTerms.begin(), anyTerms.end(), [&](const std::string& term) {
    return desc.find(upper(term)) != std::string::npos;
  });
}

const std::string& Settings::micButtonFor(ActionKind kind) const {
  static const std::string kNone;
  auto it = actionBindings.find(kind);
  return it == actionBindings.end() ? kNone : it->second.micButton;
}

Settings SettingsStore::snapshot() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return settings_;
}

void SettingsStore::replace(Settings next) {
  std::lock_guard<std::mutex> lock(mtx_);
  settings_ = std::move(next);
  ++revision_;
}

std::uint64_t SettingsStore::revision() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return revision_;
}
