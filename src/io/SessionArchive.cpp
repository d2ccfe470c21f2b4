/* @file SessionArchive.cpp
 * @brief JSON session archive
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cctype>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>

// Third-party headers
#include <nlohmann/json.hpp>

// HVLoad headers
#include "core/ProfileLoader.hpp"
#include "core/Session.hpp"
#include "io/SessionArchive.hpp"

namespace hvload::io {

  using core::SessionSummary;

  SessionArchive::SessionArchive(std::string directory) : dir_(std::move(directory)) {}

  std::string SessionArchive::fileName(const SessionSummary& s) {
    std::string reg = s.metadata.registration.empty() ? "unregistered" : s.metadata.registration;
    for (char& c : reg) {
      if (!std::isalnum(static_cast<unsigned char>(c)) && c != '-')
        c = '_';
    }
    std::string name = reg + "_discharge_" + core::formatCompact(s.startedAt);
    if (s.testMode)
      name += "_TEST";
    return name + ".json";
  }

  nlohmann::json SessionArchive::toJson(const SessionSummary& s) {
    nlohmann::json samples = nlohmann::json::array();
    for (const auto& x : s.samples) {
      samples.push_back({ { "timestamp", core::formatIso8601(x.timestamp) },
                          { "elapsed_s", x.elapsedS },
                          { "step", x.stepIndex + 1 },
                          { "voltage_v", x.voltage },
                          { "current_a", x.current },
                          { "power_w", x.power },
                          { "energy_j", x.cumulativeEnergyJ } });
    }

    return {
      { "operator", s.metadata.operatorName },
      { "registration", s.metadata.registration },
      { "location", s.metadata.location },
      { "comments", s.metadata.comments },
      { "instrument", s.instrument },
      { "test_mode", s.testMode },
      { "profile", { { "name", s.profile.name }, { "steps", core::toJson(s.profile) } } },
      { "started_at", core::formatIso8601(s.startedAt) },
      { "ended_at", core::formatIso8601(s.endedAt) },
      { "end_reason", core::toString(s.reason) },
      { "total_energy_j", s.totalEnergyJ },
      { "total_energy_kwh", s.totalEnergyKWh() },
      { "samples", std::move(samples) },
    };
  }

  void SessionArchive::publish(const SessionSummary& summary) {
    std::error_code ec;
    std::filesystem::create_directories(dir_, ec);
    if (ec)
      throw std::runtime_error("[SessionArchive] cannot create " + dir_ + ": " + ec.message());

    const std::string path = (std::filesystem::path(dir_) / fileName(summary)).string();
    std::ofstream out(path);
    if (!out)
      throw std::runtime_error("[SessionArchive] cannot open " + path);
    out << toJson(summary).dump(2) << '\n';
    if (!out)
      throw std::runtime_error("[SessionArchive] write failed: " + path);

    lastPath_ = path;
    std::cerr << "[SessionArchive] wrote " << path << '\n';
  }

} // namespace hvload::io
