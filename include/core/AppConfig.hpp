#pragma once
/** @file  AppConfig.hpp
 *  @brief Typed view of config.json with a default for every key.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <cstdint>
#include <string>

#include <nlohmann/json_fwd.hpp>

#include "core/DischargeEngine.hpp"
#include "core/InstrumentLink.hpp"
#include "core/SimulatedInstrument.hpp"

namespace hvload::core {

  struct AppConfig {
    std::string ipAddress{ "192.168.0.123" };
    std::uint16_t port{ 7000 };
    bool testMode{ false };

    LinkSettings link{};
    EngineSettings engine{};
    SimulationSettings simulation{};

    std::string logDirectory{ "logs" };
    std::string archiveDirectory{ "reports" };
    std::string profilesFile{ "profiles.json" };
    std::string operatorName{};
    std::string location{};

    /// Missing keys keep their defaults; a wrong type throws std::runtime_error naming the key.
    static AppConfig fromJson(const nlohmann::json& j);
    nlohmann::json toJson() const;
  };

} // namespace hvload::core
