/* @file AppConfig.cpp
 * @brief config.json <-> AppConfig mapping
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cstdint>
#include <stdexcept>

// Third-party headers
#include <nlohmann/json.hpp>

// HVLoad headers
#include "core/AppConfig.hpp"

namespace hvload::core {

  namespace {

    constexpr std::int64_t kMaxRetriesLimit = 100;

    template <typename T> void read(const nlohmann::json& j, const char* key, T& out) {
      auto it = j.find(key);
      if (it == j.end() || it->is_null())
        return;
      try {
        out = it->template get<T>();
      } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error(std::string("[AppConfig] bad value for '") + key + "': " + e.what());
      }
    }

    void readMs(const nlohmann::json& j, const char* key, std::chrono::milliseconds& out) {
      std::int64_t ms = out.count();
      read(j, key, ms);
      out = std::chrono::milliseconds(ms);
    }

    void require(bool ok, const char* key, const char* rule) {
      if (!ok)
        throw std::runtime_error(std::string("[AppConfig] '") + key + "' must be " + rule);
    }

  } // namespace

  AppConfig AppConfig::fromJson(const nlohmann::json& j) {
    if (!j.is_object())
      throw std::runtime_error("[AppConfig] top level must be an object");

    AppConfig c;
    read(j, "ip_address", c.ipAddress);
    int port = c.port;
    read(j, "port", port);
    require(port > 0 && port <= 65535, "port", "in 1..65535");
    c.port = static_cast<std::uint16_t>(port);
    read(j, "test_mode", c.testMode);

    readMs(j, "connect_timeout_ms", c.link.connectTimeout);
    readMs(j, "request_timeout_ms", c.link.requestTimeout);
    std::int64_t retries = c.link.maxRetries; // signed, so -1 is rejected rather than wrapped
    read(j, "max_retries", retries);
    require(retries >= 0 && retries <= kMaxRetriesLimit, "max_retries", "in 0..100");
    c.link.maxRetries = static_cast<unsigned>(retries);
    readMs(j, "backoff_ms", c.link.backoff);
    read(j, "backoff_factor", c.link.backoffFactor);
    read(j, "auto_reconnect", c.link.autoReconnect);
    require(c.link.connectTimeout.count() > 0, "connect_timeout_ms", "> 0");
    require(c.link.requestTimeout.count() > 0, "request_timeout_ms", "> 0");
    require(c.link.backoff.count() >= 0, "backoff_ms", ">= 0");
    require(c.link.backoffFactor >= 1.0, "backoff_factor", ">= 1");

    readMs(j, "sample_interval_ms", c.engine.sampleInterval);
    read(j, "fault_poll_every", c.engine.faultPollEvery);
    require(c.engine.sampleInterval.count() > 0, "sample_interval_ms", "> 0");
    c.engine.testMode = c.testMode;

    read(j, "test_mode_initial_voltage", c.simulation.initialVoltage);
    read(j, "test_mode_decay_per_tick", c.simulation.decayPerTick);
    read(j, "test_mode_resistance_factor", c.simulation.resistanceFactor);
    read(j, "test_mode_noise", c.simulation.noiseFraction);
    read(j, "test_mode_seed", c.simulation.seed);
    read(j, "test_mode_cv_current_start", c.simulation.cvCurrentStart);
    read(j, "test_mode_cv_current_decay", c.simulation.cvCurrentDecay);
    require(c.simulation.initialVoltage > 0.0, "test_mode_initial_voltage", "> 0");
    require(c.simulation.noiseFraction >= 0.0 && c.simulation.noiseFraction < 1.0,
            "test_mode_noise", "in [0, 1)");

    read(j, "log_directory", c.logDirectory);
    read(j, "archive_directory", c.archiveDirectory);
    read(j, "profiles_file", c.profilesFile);
    read(j, "operator_name", c.operatorName);
    read(j, "location", c.location);
    return c;
  }

  nlohmann::json AppConfig::toJson() const {
    return nlohmann::json{
      { "ip_address", ipAddress },
      { "port", port },
      { "test_mode", testMode },
      { "connect_timeout_ms", link.connectTimeout.count() },
      { "request_timeout_ms", link.requestTimeout.count() },
      { "max_retries", link.maxRetries },
      { "backoff_ms", link.backoff.count() },
      { "backoff_factor", link.backoffFactor },
      { "auto_reconnect", link.autoReconnect },
      { "sample_interval_ms", engine.sampleInterval.count() },
      { "fault_poll_every", engine.faultPollEvery },
      { "test_mode_initial_voltage", simulation.initialVoltage },
      { "test_mode_decay_per_tick", simulation.decayPerTick },
      { "test_mode_resistance_factor", simulation.resistanceFactor },
      { "test_mode_noise", simulation.noiseFraction },
      { "test_mode_seed", simulation.seed },
      { "test_mode_cv_current_start", simulation.cvCurrentStart },
      { "test_mode_cv_current_decay", simulation.cvCurrentDecay },
      { "log_directory", logDirectory },
      { "archive_directory", archiveDirectory },
      { "profiles_file", profilesFile },
      { "operator_name", operatorName },
      { "location", location },
    };
  }

} // namespace hvload::core
