#include "core/AppConfig.hpp"
#include "core/ConfigLoader.hpp"
#include "core/ErrorMonitor.hpp"
#include "core/Errors.hpp"
#include "core/InstrumentFactory.hpp"
#include "core/ParameterStore.hpp"
#include "core/RingBuffer.hpp"
#include "core/SimulatedInstrument.hpp"
#include "core/SystemCoordinator.hpp"
#include "io/SessionArchive.hpp"

#include <nlohmann/json.hpp>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>

using namespace hvload::core;
namespace fs = std::filesystem;

namespace {

  fs::path freshDir(const std::string& name) {
    fs::path dir = fs::temp_directory_path() / name;
    fs::remove_all(dir);
    fs::create_directories(dir);
    return dir;
  }

  std::vector<fs::path> filesIn(const fs::path& dir, const std::string& ext) {
    std::vector<fs::path> out;
    if (!fs::exists(dir))
      return out;
    for (const auto& e : fs::directory_iterator(dir))
      if (e.path().extension() == ext)
        out.push_back(e.path());
    return out;
  }

} // namespace

// ---------------------------------------------------------------- ErrorMonitor

TEST(error_monitor, escalates_once_per_unique_message) {
  ErrorMonitor monitor;
  std::vector<std::string> escalated;
  monitor.registerEscalation([&](const std::string& m) { escalated.push_back(m); });

  monitor.notifyFailure("link lost");
  monitor.notifyFailure("link lost");
  monitor.notifyFailure("device fault");
  EXPECT_EQ(escalated.size(), 2u);
  EXPECT_EQ(monitor.failureCount(), 2u);

  monitor.clear();
  monitor.notifyFailure("link lost");
  EXPECT_EQ(escalated.size(), 3u);
}

// ---------------------------------------------------------------- RingBuffer

TEST(ring_buffer, refuses_when_full_and_preserves_order) {
  RingBuffer<int> rb(2);
  EXPECT_TRUE(rb.tryPush(1));
  EXPECT_TRUE(rb.tryPush(2));
  EXPECT_FALSE(rb.tryPush(3));
  EXPECT_EQ(rb.size(), 2u);

  EXPECT_EQ(rb.popFor(std::chrono::milliseconds(1)), 1);
  EXPECT_TRUE(rb.tryPush(4));
  EXPECT_EQ(rb.popFor(std::chrono::milliseconds(1)), 2);
  EXPECT_EQ(rb.popFor(std::chrono::milliseconds(1)), 4);
  EXPECT_FALSE(rb.popFor(std::chrono::milliseconds(1)));

  EXPECT_THROW(RingBuffer<int>(0), std::invalid_argument);
}

// ---------------------------------------------------------------- ParameterStore

TEST(parameter_store, tracks_latest_sample) {
  ParameterStore store;
  EXPECT_FALSE(store.hasData());
  EXPECT_DOUBLE_EQ(store.get(Parameter::Voltage), 0.0);

  Sample s;
  s.voltage = 395.0;
  s.current = 10.0;
  s.power = 3950.0;
  s.cumulativeEnergyJ = 3950.0;
  s.stepIndex = 1;
  s.elapsedS = 2.5;
  store.publish(s);

  EXPECT_TRUE(store.hasData());
  EXPECT_DOUBLE_EQ(store.get(Parameter::Voltage), 395.0);
  EXPECT_DOUBLE_EQ(store.get(Parameter::Energy), 3950.0);
  EXPECT_DOUBLE_EQ(store.get(Parameter::Step), 2.0);
  EXPECT_DOUBLE_EQ(store.get(Parameter::Elapsed), 2.5);
}

// ---------------------------------------------------------------- configuration

TEST(app_config, defaults_for_missing_keys) {
  AppConfig c = AppConfig::fromJson(nlohmann::json::object());
  EXPECT_EQ(c.ipAddress, "192.168.0.123");
  EXPECT_EQ(c.port, 7000);
  EXPECT_FALSE(c.testMode);
  EXPECT_EQ(c.link.maxRetries, 2u);
  EXPECT_EQ(c.engine.sampleInterval, std::chrono::milliseconds(1000));
}

TEST(app_config, maps_keys_onto_subsystems) {
  auto j = nlohmann::json::parse(R"({
    "ip_address": "10.1.2.3", "port": 5025, "request_timeout_ms": 250, "max_retries": 4,
    "auto_reconnect": false, "sample_interval_ms": 500, "test_mode": true,
    "test_mode_initial_voltage": 800, "test_mode_decay_per_tick": 2.5, "log_directory": "/tmp/l"
  })");
  AppConfig c = AppConfig::fromJson(j);
  EXPECT_EQ(c.ipAddress, "10.1.2.3");
  EXPECT_EQ(c.port, 5025);
  EXPECT_EQ(c.link.requestTimeout, std::chrono::milliseconds(250));
  EXPECT_EQ(c.link.maxRetries, 4u);
  EXPECT_FALSE(c.link.autoReconnect);
  EXPECT_EQ(c.engine.sampleInterval, std::chrono::milliseconds(500));
  EXPECT_TRUE(c.engine.testMode);
  EXPECT_DOUBLE_EQ(c.simulation.initialVoltage, 800.0);
  EXPECT_DOUBLE_EQ(c.simulation.decayPerTick, 2.5);
  EXPECT_EQ(c.logDirectory, "/tmp/l");

  EXPECT_EQ(AppConfig::fromJson(c.toJson()).toJson(), c.toJson());
}

TEST(app_config, bad_values_name_the_key) {
  try {
    AppConfig::fromJson(nlohmann::json{ { "port", "seven thousand" } });
    FAIL() << "expected runtime_error";
  } catch (const std::runtime_error& e) {
    EXPECT_THAT(e.what(), testing::HasSubstr("port"));
  }
  EXPECT_THROW(AppConfig::fromJson(nlohmann::json{ { "port", 70000 } }), std::runtime_error);
  EXPECT_THROW(AppConfig::fromJson(nlohmann::json{ { "sample_interval_ms", 0 } }),
               std::runtime_error);
}

TEST(app_config, retry_and_timeout_bounds) {
  try {
    AppConfig::fromJson(nlohmann::json{ { "max_retries", -1 } });
    FAIL() << "expected runtime_error";
  } catch (const std::runtime_error& e) {
    EXPECT_THAT(e.what(), testing::HasSubstr("max_retries"));
  }
  EXPECT_THROW(AppConfig::fromJson(nlohmann::json{ { "max_retries", 4294967295LL } }),
               std::runtime_error);
  EXPECT_THROW(AppConfig::fromJson(nlohmann::json{ { "connect_timeout_ms", -1 } }),
               std::runtime_error);
  EXPECT_THROW(AppConfig::fromJson(nlohmann::json{ { "connect_timeout_ms", 0 } }),
               std::runtime_error);
  EXPECT_THROW(AppConfig::fromJson(nlohmann::json{ { "backoff_ms", -5 } }), std::runtime_error);

  AppConfig c = AppConfig::fromJson(nlohmann::json{ { "max_retries", 0 }, { "backoff_ms", 0 } });
  EXPECT_EQ(c.link.maxRetries, 0u);
  EXPECT_EQ(c.link.backoff, std::chrono::milliseconds(0));
}

TEST(config_loader, reads_file_and_reports_parse_errors) {
  const fs::path dir = freshDir("hvload_config_test");
  const fs::path good = dir / "config.json";
  std::ofstream(good) << R"({ "port": 6000 })";
  const fs::path bad = dir / "bad.json";
  std::ofstream(bad) << "{ port: ";

  ConfigLoader loader(good.string());
  EXPECT_TRUE(loader.exists());
  EXPECT_EQ(AppConfig::fromJson(loader.load()).port, 6000);

  EXPECT_THROW(ConfigLoader(bad.string()).load(), std::runtime_error);
  EXPECT_FALSE(ConfigLoader((dir / "missing.json").string()).exists());
  EXPECT_THROW(ConfigLoader((dir / "missing.json").string()).load(), std::runtime_error);
}

// ---------------------------------------------------------------- InstrumentFactory

TEST(instrument_factory, registers_and_creates_by_name) {
  InstrumentFactory factory;
  EXPECT_TRUE(factory.registerInstrument("simulated",
                                         [] { return std::make_shared<SimulatedInstrument>(); }));
  EXPECT_FALSE(factory.registerInstrument("simulated",
                                          [] { return std::make_shared<SimulatedInstrument>(); }));
  EXPECT_TRUE(factory.contains("simulated"));

  auto inst = factory.create("simulated");
  ASSERT_TRUE(inst);
  EXPECT_EQ(inst->connectionState(), ConnectionState::Disconnected);
  EXPECT_THROW(factory.create("gpib"), std::out_of_range);
  EXPECT_EQ(factory.names(), std::vector<std::string>{ "simulated" });
}

// ---------------------------------------------------------------- SessionArchive

TEST(session_archive, writes_named_json_report) {
  const fs::path dir = freshDir("hvload_archive_test");

  SessionSummary s;
  s.profile = { "Default CP", { { StepKind::ConstantPower, 2000.0, { StopMetric::Voltage, 320.0 } } } };
  s.metadata = { "J. Doe", "AB12 CDE", "Bay 3", "post-crash" };
  s.instrument = "Simulated Instrument";
  s.testMode = true;
  s.startedAt = WallClock::now();
  s.endedAt = s.startedAt + std::chrono::seconds(20);
  s.totalEnergyJ = 7.2e6;
  Sample x;
  x.voltage = 395.0;
  x.current = 5.0;
  s.samples.push_back(x);

  EXPECT_EQ(hvload::io::SessionArchive::fileName(s),
            "AB12_CDE_discharge_" + formatCompact(s.startedAt) + "_TEST.json");

  hvload::io::SessionArchive archive(dir.string());
  archive.publish(s);
  ASSERT_FALSE(archive.lastPath().empty());

  std::ifstream in(archive.lastPath());
  auto j = nlohmann::json::parse(in);
  EXPECT_EQ(j.at("registration"), "AB12 CDE");
  EXPECT_EQ(j.at("test_mode"), true);
  EXPECT_DOUBLE_EQ(j.at("total_energy_kwh").get<double>(), 2.0);
  EXPECT_EQ(j.at("end_reason"), "profile complete");
  EXPECT_EQ(j.at("profile").at("steps").size(), 1u);
  EXPECT_EQ(j.at("samples").size(), 1u);
}

// ---------------------------------------------------------------- SystemCoordinator

class SystemCoordinatorTest : public ::testing::Test {
protected:
  void SetUp() override {
    logs = freshDir("hvload_coord_logs");
    reports = freshDir("hvload_coord_reports");

    config.testMode = true;
    config.engine.sampleInterval = std::chrono::milliseconds(1);
    config.simulation.decayPerTick = 5.0;
    config.simulation.noiseFraction = 0.0;
    config.logDirectory = logs.string();
    config.archiveDirectory = reports.string();
  }

  AppConfig config;
  fs::path logs;
  fs::path reports;
};

TEST_F(SystemCoordinatorTest, TestModeRun_ArchivesAndLogs) {
  SystemCoordinator coordinator(config, defaultProfiles());
  coordinator.initialize();
  EXPECT_EQ(coordinator.state(), SystemCoordinator::State::IDLE);

  ControlFlags flags;
  RunRequest req{ "Default CC", { "J. Doe", "AB12CDE", "Bay 3", "" } };
  EXPECT_EQ(coordinator.run(req, flags), 0);
  EXPECT_EQ(coordinator.state(), SystemCoordinator::State::FINISHED);
  EXPECT_EQ(coordinator.engine().history().size(), 20u);

  auto archives = filesIn(reports, ".json");
  ASSERT_EQ(archives.size(), 1u);
  EXPECT_THAT(archives.front().filename().string(), testing::EndsWith("_TEST.json"));
  auto csvs = filesIn(logs, ".csv");
  ASSERT_EQ(csvs.size(), 1u);
  EXPECT_GT(fs::file_size(csvs.front()), 0u);
}

TEST_F(SystemCoordinatorTest, StopFlag_EndsRunCleanly) {
  config.simulation.decayPerTick = 0.001; // would run for a long time
  SystemCoordinator coordinator(config, defaultProfiles());
  coordinator.initialize();

  ControlFlags flags;
  flags.stop = true;
  EXPECT_EQ(coordinator.run({ "Default CC", {} }, flags), 0);
  EXPECT_EQ(coordinator.engine().state(), EngineState::Completed);
}

TEST_F(SystemCoordinatorTest, FaultedRun_ReturnsNonZero) {
  config.simulation.faultAfterMeasurements = 2;
  SystemCoordinator coordinator(config, defaultProfiles());
  coordinator.initialize();

  ControlFlags flags;
  EXPECT_EQ(coordinator.run({ "Default CP", {} }, flags), 1);
  EXPECT_EQ(coordinator.state(), SystemCoordinator::State::ERROR);
  ASSERT_TRUE(coordinator.engine().lastFault());
  EXPECT_EQ(coordinator.engine().lastFault()->kind, ErrorKind::DeviceFault);
}

TEST_F(SystemCoordinatorTest, CalibrationCheck_ReportsIdleInstrument) {
  SystemCoordinator coordinator(config, defaultProfiles());
  EXPECT_THROW(coordinator.calibrationCheck(), std::logic_error);
  coordinator.initialize();

  auto status = coordinator.calibrationCheck();
  EXPECT_DOUBLE_EQ(status.reading.voltage, config.simulation.initialVoltage);
  EXPECT_DOUBLE_EQ(status.reading.current, 0.0);
  EXPECT_FALSE(status.inputOn);
  EXPECT_EQ(status.function, "CC");
}

TEST_F(SystemCoordinatorTest, UnknownProfile_IsRejected) {
  SystemCoordinator coordinator(config, defaultProfiles());
  coordinator.initialize();
  ControlFlags flags;
  EXPECT_THROW(coordinator.run({ "Nope", {} }, flags), ValidationError);
}
