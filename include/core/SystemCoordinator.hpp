#pragma once

/** @file  SystemCoordinator.hpp
 *  @brief Public API for hvload::core::SystemCoordinator.
 *
 *  © 2025 Milo Medical — licensed under MIT.
 */

#include <atomic>
#include <memory>
#include <string>

#include "core/AppConfig.hpp"
#include "core/Instrument.hpp"
#include "core/InstrumentFactory.hpp"
#include "core/ProfileLoader.hpp"
#include "core/Session.hpp"

namespace hvload {
  namespace io {
    class SessionArchive;
  }

  namespace core {

    class DischargeEngine;
    class ErrorMonitor;
    class Logger;
    class ParameterStore;

    /// Asynchronous requests raised by signal handlers; consumed by run().
    struct ControlFlags {
      std::atomic<bool> stop{ false };
      std::atomic<bool> togglePause{ false };
    };

    struct RunRequest {
      std::string profileName;
      SessionMetadata metadata;
    };

    /**
 * @class SystemCoordinator
 * @brief Owns every subsystem of one hvload process and drives a single session.
 *
 *  * initialize(): picks "simulated" or "tcp" from the factory, wires sinks, connects.
 *  * run(): starts the profile, prints the live readout, waits for Completed/Faulted.
 *  * The instrument is reached only through the engine.
 *  * Creators registered on factory() before initialize() take precedence.
 */
    class SystemCoordinator {

    public:
      enum class State { BOOT, INIT, IDLE, RUNNING, FINISHED, ERROR };

      SystemCoordinator(AppConfig config, ProfileMap profiles);
      ~SystemCoordinator();

      SystemCoordinator(const SystemCoordinator&) = delete;
      SystemCoordinator& operator=(const SystemCoordinator&) = delete;

      void initialize(); ///< build instrument, engine and sinks; connect
      /// Blocks until the session ends. Returns 0 on Completed, 1 on Faulted.
      int run(const RunRequest& request, ControlFlags& flags);
      void handleStart(const RunRequest& request); ///< validate + queue Start
      void handleAbort();                          ///< operator Stop
      void handleError(const std::string& reason);
      /// Queries and prints IDN, V/I/P, input state and load function.
      InstrumentStatus calibrationCheck();

      InstrumentFactory& factory() { return factory_; }
      State state() const { return currentState_.load(); }
      DischargeEngine& engine();
      const ParameterStore& readout() const;
      std::string statusLine() const;

    private:
      void transitionTo(State next);
      void wireEngine();
      ExpectedStart expectedStart() const;

      AppConfig config_;
      ProfileMap profiles_;
      InstrumentFactory factory_;

      std::shared_ptr<ErrorMonitor> errors_;
      std::shared_ptr<Logger> logger_;
      std::shared_ptr<ParameterStore> readout_;
      std::shared_ptr<io::SessionArchive> archive_;
      std::unique_ptr<DischargeEngine> engine_;

      std::atomic<State> currentState_{ State::BOOT };
    };

    const char* toString(SystemCoordinator::State s);

  } // namespace core
} // namespace hvload
