#pragma once
/** @file  DischargeEngine.hpp
 *  @brief Session state machine, sampling loop, stop conditions and energy accounting.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

// HVLoad headers
#include "core/ErrorMonitor.hpp"
#include "core/Errors.hpp"
#include "core/Instrument.hpp"
#include "core/ProfileModel.hpp"
#include "core/Session.hpp"
#include "core/SessionSinks.hpp"

namespace hvload {
  namespace core {

    enum class EngineState : std::uint8_t { Idle, Running, Paused, Stopping, Completed, Faulted };

    inline const char* toString(EngineState s) {
      switch (s) {
      case EngineState::Idle:
        return "Idle";
      case EngineState::Running:
        return "Running";
      case EngineState::Paused:
        return "Paused";
      case EngineState::Stopping:
        return "Stopping";
      case EngineState::Completed:
        return "Completed";
      case EngineState::Faulted:
        return "Faulted";
      default:
        return "Unknown";
      }
    }

    struct EngineSettings {
      std::chrono::milliseconds sampleInterval{ 1000 }; ///< tick period and integration step
      unsigned faultPollEvery{ 1 };                     ///< query fault status every N ticks, 0 = never
      bool testMode{ false };                           ///< only recorded in the summary
    };

    /// Why a session ended in Faulted; kept until the next Start or Reset.
    struct FaultReport {
      ErrorKind kind{ ErrorKind::Connection };
      std::string message;
      std::string context; ///< offending command / reply
      std::optional<std::size_t> stepIndex;
    };

    /**
 * @class DischargeEngine
 * @brief Runs one validated profile at a time against any Instrument.
 *
 *  * Control calls validate synchronously (StateError / ValidationError) and are
 *    queued; the loop applies them at the next tick boundary.
 *  * Reset and Acknowledge touch no hardware and apply at once.
 *  * `tick()` is one loop iteration; `launch()` runs it on a worker thread every
 *    `sampleInterval`.
 *  * Energy: rectangular rule, power at the tick times the nominal interval.
 */
    class DischargeEngine {
    public:
      using StateListener = std::function<void(EngineState from, EngineState to)>;
      using StepListener = std::function<void(std::size_t finished, std::size_t next)>;

      DischargeEngine(std::shared_ptr<Instrument> instrument,
                      std::shared_ptr<ErrorMonitor> errorMonitor, EngineSettings settings = {});
      ~DischargeEngine();

      DischargeEngine(const DischargeEngine&) = delete;
      DischargeEngine& operator=(const DischargeEngine&) = delete;

      //---control surface--------------------------------------------------
      void start(ValidatedProfile profile, SessionMetadata metadata);
      void pause();
      void resume();
      void stop(); ///< also interrupts an in-flight retry
      void reset();
      void acknowledge(); ///< Completed/Faulted -> Idle, data kept until reset()

      //---instrument access outside a session--------------------------------
      void connect(const std::string& address, std::uint16_t port);
      /// Idle or Completed only; a Faulted engine sends nothing more.
      InstrumentStatus probeStatus();
      /// Stops the loop and closes the instrument: input-off first unless Faulted.
      void release();
      std::string instrumentIdentity() const { return instrument_->identity(); }

      //---observers--------------------------------------------------------
      void addSampleSink(std::shared_ptr<SampleSink> sink);
      void setSummarySink(std::shared_ptr<SummarySink> sink);
      void registerStateListener(StateListener cb);
      void registerStepListener(StepListener cb);

      //---loop-------------------------------------------------------------
      void tick();
      void launch();
      void shutdown();

      //---snapshots (thread-safe copies)-----------------------------------
      EngineState state() const;
      std::size_t activeStepIndex() const;
      double energyJ() const;
      std::vector<Sample> history() const;
      std::optional<FaultReport> lastFault() const;
      const EngineSettings& settings() const { return settings_; }

    private:
      enum class CommandKind : std::uint8_t { Start, Pause, Resume, Stop };

      struct PendingCommand {
        CommandKind kind;
        std::optional<ValidatedProfile> profile{};
        SessionMetadata metadata{};
      };

      struct ActiveSession {
        ValidatedProfile profile;
        SessionMetadata metadata;
        std::size_t activeStep{ 0 };
        double energyJ{ 0.0 };
        std::vector<Sample> history{};
        std::size_t ticks{ 0 };
        WallClock::time_point startedAt{};
        std::chrono::steady_clock::time_point startedMono{};
      };

      void enqueue(PendingCommand cmd, const char* name);
      void requireOutsideSession(const char* name) const;
      EngineState projectedStateLocked() const;
      void applyPending();
      void apply(PendingCommand& cmd);
      void beginSession(PendingCommand& cmd);
      void pauseOutput();
      void resumeOutput();
      void sampleOnce();
      void advanceStep();
      void finish(EndReason reason);
      void fault(const DischargeError& err);
      void transitionTo(EngineState next);
      void notifyState(EngineState from, EngineState to);
      void publish(const Sample& sample);
      void flushSinks();
      void workerLoop();

      std::shared_ptr<Instrument> instrument_;
      std::shared_ptr<ErrorMonitor> errorMonitor_;
      EngineSettings settings_;

      mutable std::mutex mtx_; ///< state_, pending_, session_, lastFault_
      EngineState state_{ EngineState::Idle };
      std::deque<PendingCommand> pending_;
      std::optional<ActiveSession> session_;
      std::optional<FaultReport> lastFault_;
      std::atomic<bool> stopRequested_{ false };

      mutable std::mutex observersMtx_;
      std::vector<std::shared_ptr<SampleSink>> sampleSinks_;
      std::shared_ptr<SummarySink> summarySink_;
      std::vector<StateListener> stateListeners_;
      std::vector<StepListener> stepListeners_;

      std::mutex tickMtx_; ///< one loop iteration at a time
      std::thread worker_;
      std::atomic<bool> running_{ false };
      std::mutex wakeMtx_;
      std::condition_variable wakeCv_;
    };

  } // namespace core
} // namespace hvload
