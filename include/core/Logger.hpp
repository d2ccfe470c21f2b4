#pragma once
/** @file  Logger.hpp
 *  @brief Asynchronous CSV run logger (runs its own worker thread).
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

#include "core/Session.hpp"
#include "core/SessionSinks.hpp"
#include "io/FileLogger.hpp"

namespace hvload {
  namespace core {

    /// One CSV row; measurement columns are empty for pure events.
    struct LogEvent {
      WallClock::time_point timestamp{};
      std::string event; ///< "sample", "state", "step", "fault", ...
      std::optional<Sample> sample{};
      std::optional<std::size_t> stepIndex{};
      std::string message{};
    };

    template <typename T> class RingBuffer; // forward decl to avoid heavy include

    /**
 * @class Logger
 * @brief Persistent per-run log: samples plus engine events, one CSV file per run.
 *
 *  * `log()` never blocks; rows are dropped (and counted) when the queue is full.
 *  * The worker drains the queue into a FileLogger and fflushes when idle.
 */
    class Logger : public SampleSink {

    public:
      static constexpr const char* kHeader =
          "timestamp,elapsed_s,event,step,voltage_v,current_a,power_w,energy_j,message\n";

      explicit Logger(std::size_t capacity = 4096);
      ~Logger() override;

      // --- public API ---
      bool startNewRun(const std::string& csvPath); ///< open file + launch worker thread
      void log(const LogEvent& event);              ///< enqueue event (non-blocking)
      void logMessage(const std::string& event, const std::string& message,
                      std::optional<std::size_t> stepIndex = std::nullopt);
      void finishRun(); ///< flush + join worker thread

      // --- SampleSink ---
      void publish(const Sample& sample) override;
      void flush() override; ///< waits (bounded) until queued rows hit the disk

      std::size_t dropped() const { return dropped_.load(); }

      static std::string toCsv(const LogEvent& event);

    private:
      void drain();

      io::FileLogger file_;
      std::mutex fileMtx_;
      std::unique_ptr<RingBuffer<LogEvent>> buffer_;
      std::thread worker_;
      std::atomic<bool> running_{ false };

      std::atomic<std::size_t> accepted_{ 0 };
      std::atomic<std::size_t> dropped_{ 0 };
      std::size_t written_{ 0 }; ///< guarded by progressMtx_
      std::mutex progressMtx_;
      std::condition_variable progressCv_;
    };

  } // namespace core
} // namespace hvload
