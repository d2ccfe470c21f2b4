#pragma once
/** @file  ProfileLoader.hpp
 *  @brief Reads named discharge profiles from profiles.json.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <map>
#include <string>

#include <nlohmann/json_fwd.hpp>

#include "core/DischargeProfile.hpp"

namespace hvload::core {

  using ProfileMap = std::map<std::string, DischargeProfile>;

  /**
 * @brief Map `{ "<name>": [ {step}, ... ] }` onto profiles.
 *
 *  * Steps without `stop_condition_type` are migrated from the older
 *    `stop_voltage` layout.
 *  * An unknown `type` or a missing `value` throws ValidationError with the step index.
 */
  ProfileMap parseProfiles(const nlohmann::json& j);

  /// Built-in set used when no profile file exists.
  ProfileMap defaultProfiles();

  /// Parse @p path, or return defaultProfiles() when the file is absent.
  ProfileMap loadProfiles(const std::string& path);

  nlohmann::json toJson(const DischargeProfile& profile);

} // namespace hvload::core
