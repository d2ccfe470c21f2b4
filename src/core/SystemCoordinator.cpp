/* @file SystemCoordinator.cpp
 * @brief process-level wiring and the single-session run loop
 *
 * © 2025 Milo Medical — licensed under MIT.
 */

// STL headers
#include <cctype>
#include <cstdio>
#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <thread>

// HVLoad headers
#include "core/DischargeEngine.hpp"
#include "core/ErrorMonitor.hpp"
#include "core/Errors.hpp"
#include "core/InstrumentLink.hpp"
#include "core/Logger.hpp"
#include "core/ParameterStore.hpp"
#include "core/ProfileModel.hpp"
#include "core/SimulatedInstrument.hpp"
#include "core/SystemCoordinator.hpp"
#include "io/SessionArchive.hpp"

namespace hvload::core {

  namespace {
    constexpr auto kPollPeriod = std::chrono::milliseconds(50);
  }

  const char* toString(SystemCoordinator::State s) {
    switch (s) {
    case SystemCoordinator::State::BOOT:
      return "BOOT";
    case SystemCoordinator::State::INIT:
      return "INIT";
    case SystemCoordinator::State::IDLE:
      return "IDLE";
    case SystemCoordinator::State::RUNNING:
      return "RUNNING";
    case SystemCoordinator::State::FINISHED:
      return "FINISHED";
    case SystemCoordinator::State::ERROR:
      return "ERROR";
    default:
      return "Unknown";
    }
  }

  SystemCoordinator::SystemCoordinator(AppConfig config, ProfileMap profiles)
      : config_(std::move(config)), profiles_(std::move(profiles)),
        errors_(std::make_shared<ErrorMonitor>()) {}

  SystemCoordinator::~SystemCoordinator() {
    if (engine_)
      engine_->shutdown();
    if (logger_)
      logger_->finishRun();
  }

  DischargeEngine& SystemCoordinator::engine() {
    if (!engine_)
      throw std::logic_error("[SystemCoordinator] initialize() not called");
    return *engine_;
  }

  const ParameterStore& SystemCoordinator::readout() const {
    if (!readout_)
      throw std::logic_error("[SystemCoordinator] initialize() not called");
    return *readout_;
  }

  void SystemCoordinator::initialize() {
    transitionTo(State::INIT);

    const LinkSettings link = config_.link;
    const SimulationSettings sim = config_.simulation;
    auto monitor = errors_;
    factory_.registerInstrument(
        "tcp", [monitor, link] { return std::make_shared<InstrumentLink>(monitor, link); });
    factory_.registerInstrument("simulated",
                                [sim] { return std::make_shared<SimulatedInstrument>(sim); });

    auto instrument = factory_.create(config_.testMode ? "simulated" : "tcp");

    EngineSettings engineSettings = config_.engine;
    engineSettings.testMode = config_.testMode;
    engine_ = std::make_unique<DischargeEngine>(std::move(instrument), errors_, engineSettings);

    logger_ = std::make_shared<Logger>();
    readout_ = std::make_shared<ParameterStore>();
    archive_ = std::make_shared<io::SessionArchive>(config_.archiveDirectory);
    engine_->addSampleSink(logger_);
    engine_->addSampleSink(readout_);
    engine_->setSummarySink(archive_);
    wireEngine();

    errors_->registerEscalation([this](const std::string& msg) { handleError(msg); });

    std::cerr << "[SystemCoordinator] connecting to " << config_.ipAddress << ':' << config_.port
              << (config_.testMode ? " (test mode)" : "") << '\n';
    engine_->connect(config_.ipAddress, config_.port);
    std::cerr << "[SystemCoordinator] instrument: " << engine_->instrumentIdentity() << '\n';

    transitionTo(State::IDLE);
  }

  void SystemCoordinator::wireEngine() {
    engine_->registerStateListener([this](EngineState from, EngineState to) {
      logger_->logMessage("state", std::string(toString(from)) + " -> " + toString(to));
      if (to == EngineState::Faulted) {
        if (auto report = engine_->lastFault())
          logger_->logMessage("fault",
                              std::string(toString(report->kind)) + ": " + report->message,
                              report->stepIndex);
      }
    });
    engine_->registerStepListener([this](std::size_t finished, std::size_t next) {
      logger_->logMessage("step",
                          "step " + std::to_string(finished + 1) + " done, starting " +
                              std::to_string(next + 1),
                          next);
    });
  }

  ExpectedStart SystemCoordinator::expectedStart() const {
    ExpectedStart expected;
    if (config_.testMode) {
      expected.voltage = config_.simulation.initialVoltage;
      expected.cvStartCurrent = config_.simulation.cvCurrentStart;
      return expected;
    }
    try {
      expected.voltage = engine_->probeStatus().reading.voltage;
    } catch (const DischargeError& e) {
      std::cerr << "[SystemCoordinator] open-circuit voltage unknown: " << e.what() << '\n';
    }
    return expected;
  }

  void SystemCoordinator::handleStart(const RunRequest& request) {
    auto it = profiles_.find(request.profileName);
    if (it == profiles_.end())
      throw ValidationError("unknown profile '" + request.profileName + "'");

    ValidatedProfile profile = ProfileModel(expectedStart()).validate(it->second);

    std::string reg = request.metadata.registration.empty() ? std::string("unregistered")
                                                            : request.metadata.registration;
    for (char& c : reg) {
      if (!std::isalnum(static_cast<unsigned char>(c)) && c != '-')
        c = '_';
    }
    std::error_code ec;
    std::filesystem::create_directories(config_.logDirectory, ec);
    const std::string csv =
        (std::filesystem::path(config_.logDirectory) /
         (reg + "_discharge_" + formatCompact(WallClock::now()) +
          (config_.testMode ? "_TEST" : "") + ".csv"))
            .string();
    if (!logger_->startNewRun(csv))
      std::cerr << "[SystemCoordinator] run log disabled, cannot open " << csv << '\n';

    errors_->clear();
    engine_->start(std::move(profile), request.metadata);
    logger_->logMessage("start", "profile " + request.profileName);
    transitionTo(State::RUNNING);
  }

  void SystemCoordinator::handleAbort() {
    try {
      engine_->stop();
      logger_->logMessage("stop", "operator stop");
    } catch (const StateError& e) {
      std::cerr << "[SystemCoordinator] " << e.what() << '\n';
    }
  }

  void SystemCoordinator::handleError(const std::string& reason) {
    std::cerr << "[SystemCoordinator] fault: " << reason << '\n';
    transitionTo(State::ERROR);
  }

  int SystemCoordinator::run(const RunRequest& request, ControlFlags& flags) {
    handleStart(request);
    engine_->launch();

    const auto printEvery = config_.engine.sampleInterval;
    auto nextPrint = std::chrono::steady_clock::now();
    EngineState st = engine_->state();
    for (;;) {
      st = engine_->state();
      if (st == EngineState::Completed || st == EngineState::Faulted)
        break;

      if (flags.stop.exchange(false))
        handleAbort();
      if (flags.togglePause.exchange(false)) {
        try {
          if (st == EngineState::Paused)
            engine_->resume();
          else
            engine_->pause();
        } catch (const StateError& e) {
          std::cerr << "[SystemCoordinator] " << e.what() << '\n';
        }
      }

      const auto now = std::chrono::steady_clock::now();
      if (now >= nextPrint && readout_->hasData()) {
        std::cout << '\r' << statusLine() << std::flush;
        nextPrint = now + printEvery;
      }
      std::this_thread::sleep_for(kPollPeriod);
    }
    std::cout << '\n';

    engine_->release();
    logger_->finishRun();

    if (st == EngineState::Completed) {
      std::cout << "Discharge complete: " << engine_->energyJ() / kJoulesPerKWh << " kWh";
      if (!archive_->lastPath().empty())
        std::cout << ", report " << archive_->lastPath();
      std::cout << '\n';
      transitionTo(State::FINISHED);
      return 0;
    }

    if (auto report = engine_->lastFault())
      std::cout << "Discharge FAULTED: " << report->message << '\n';
    transitionTo(State::ERROR);
    return 1;
  }

  InstrumentStatus SystemCoordinator::calibrationCheck() {
    const InstrumentStatus status = engine().probeStatus();
    if (config_.testMode)
      std::cout << "Test mode: readings come from the simulator, not a real load\n";

    char buf[64];
    std::cout << "*IDN?          " << engine_->instrumentIdentity() << '\n';
    std::snprintf(buf, sizeof buf, "%.3f V", status.reading.voltage);
    std::cout << "MEAS:VOLT?     " << buf << '\n';
    std::snprintf(buf, sizeof buf, "%.3f A", status.reading.current);
    std::cout << "MEAS:CURR?     " << buf << '\n';
    std::snprintf(buf, sizeof buf, "%.1f W", status.power);
    std::cout << "MEAS:POW?      " << buf << '\n';
    std::cout << "INPut:STATe?   " << (status.inputOn ? "ON" : "OFF") << '\n';
    std::cout << "INPut:FUNCtion? " << status.function << '\n';
    return status;
  }

  std::string SystemCoordinator::statusLine() const {
    const ParameterStore& r = *readout_;
    char buf[160];
    std::snprintf(buf, sizeof buf,
                  "step %.0f | %7.2f V | %6.2f A | %8.1f W | %.4f kWh | %6.0f s | %s",
                  r.get(Parameter::Step), r.get(Parameter::Voltage), r.get(Parameter::Current),
                  r.get(Parameter::Power), r.get(Parameter::Energy) / kJoulesPerKWh,
                  r.get(Parameter::Elapsed), toString(engine_->state()));
    return buf;
  }

  void SystemCoordinator::transitionTo(State next) {
    const State prev = currentState_.exchange(next);
    if (prev != next)
      std::cerr << "[SystemCoordinator] " << toString(prev) << " -> " << toString(next) << '\n';
  }

} // namespace hvload::core
