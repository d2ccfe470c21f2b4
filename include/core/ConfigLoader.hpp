#pragma once
/** @file  ConfigLoader.hpp
 *  @brief Loads run-time configuration (JSON) from the host FS.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <string>

#include <nlohmann/json_fwd.hpp>

namespace hvload::core {

  /**
 * @class ConfigLoader
 * @brief Thin helper that reads a JSON file and hands the parsed object to the caller.
 *
 *  * No caching: every call to `load()` re-reads the file.
 *  * All schema mapping lives in the calling layer (AppConfig, ProfileLoader).
 */
  class ConfigLoader {
  public:
    /// @param configPath  Absolute or relative path on the host FS.
    explicit ConfigLoader(std::string configPath);

    /// Parse the file into a nlohmann::json object or throw `std::runtime_error`.
    nlohmann::json load() const;

    bool exists() const;

    const std::string& path() const { return path_; }

  private:
    std::string path_;
  };

} // namespace hvload::core
