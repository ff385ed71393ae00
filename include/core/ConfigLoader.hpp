#pragma once
/** @file  ConfigLoader.hpp
 *  @brief Loads run-time configuration (JSON) from the host FS.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <string>

#include <nlohmann/json_fwd.hpp>

#include "core/Settings.hpp"

namespace radflow::core {

  /**
 * @class ConfigLoader
 * @brief Thin helper that reads a JSON file and maps it onto Settings.
 *
 *  * No caching — every call to `load()` re-reads the file (cheap, tiny file).
 *  * Every key is optional; a missing key keeps the Settings default.
 */
  class ConfigLoader {
  public:
    /// @param configPath  Absolute or relative path on the host FS.
    explicit ConfigLoader(std::string configPath);

    /// Parse the file into a nlohmann::json object or throw `std::runtime_error`.
    nlohmann::json load() const;

    /// `load()` + `parseSettings()`.
    Settings loadSettings() const;

    /// Map a parsed document onto Settings; throws `std::invalid_argument` on
    /// wrongly typed values or unknown action names.
    static Settings parseSettings(const nlohmann::json& doc);

    const std::string& path() const { return path_; }

  private:
    std::string path_;
  };

} // namespace radflow::core
