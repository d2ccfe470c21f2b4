#pragma once
/** @file  InstrumentLink.hpp
 *  @brief SCPI-over-TCP client for the electronic load, with bounded retry.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>

// HVLoad headers
#include "core/ErrorMonitor.hpp" // InstrumentLink is a client to the error monitor
#include "core/Instrument.hpp"
#include "io/TcpChannel.hpp" // InstrumentLink owns its channel and requires full type knowledge
#include "protocols/Command.hpp"
#include "protocols/Response.hpp"

namespace hvload {
  namespace core {

    struct LinkSettings {
      std::chrono::milliseconds connectTimeout{ 5000 };
      std::chrono::milliseconds requestTimeout{ 1000 }; ///< per attempt
      unsigned maxRetries{ 2 };                         ///< attempts = maxRetries + 1
      std::chrono::milliseconds backoff{ 100 };         ///< wait before the first retry
      double backoffFactor{ 2.0 };
      bool autoReconnect{ true };
    };

    /**
 * @class InstrumentLink
 * @brief Owns the TCP connection to the load and speaks SCPI over it.
 *
 *  * One outstanding request at a time (no pipelining).
 *  * Timeouts and dropped sockets are retried with exponential backoff, reconnecting
 *    first when enabled; malformed replies are not retried.
 *  * Input is discarded before every request, and replies owed to timed-out
 *    attempts are drained after a retry succeeds.
 *  * The abort check installed by the engine interrupts retries and backoff.
 */
    class InstrumentLink : public Instrument {
    public:
      explicit InstrumentLink(std::shared_ptr<ErrorMonitor> errMonitor, LinkSettings settings = {},
                              std::unique_ptr<io::TcpChannel> channel = nullptr);
      ~InstrumentLink() override;

      //---public APIs------------------------------------------------------
      void connect(const std::string& address, std::uint16_t port) override;
      void disconnect() override;
      void release() override;
      void setMode(StepKind kind, double magnitude) override;
      void setInputEnabled(bool on) override;
      Measurement queryMeasurement() override;
      InstrumentStatus queryStatus() override;
      std::optional<FaultCode> queryFault() override;
      std::string identity() const override;
      ConnectionState connectionState() const override { return state_.load(); }
      void setAbortCheck(AbortCheck check) override { abortCheck_ = std::move(check); }

    private:
      protocols::Response query(const protocols::Command& cmd);
      void send(const protocols::Command& cmd);
      double measure(const protocols::Command& cmd, std::string_view unit);

      void requireConnected(const protocols::Command& cmd) const;
      bool ensureOpen();
      void drainLateReplies(unsigned count, const std::string& context);
      void waitBackoff(unsigned attempt, const std::string& context);
      void checkAbort(const std::string& context) const;
      void giveUp(const std::string& message);

      std::shared_ptr<ErrorMonitor> errorMonitor_;
      LinkSettings settings_;
      std::unique_ptr<io::TcpChannel> channel_;
      AbortCheck abortCheck_{};

      std::string address_{};
      std::uint16_t port_{ 0 };
      std::string identity_{};
      std::atomic<ConnectionState> state_{ ConnectionState::Disconnected };
      mutable std::mutex ioMtx_; ///< serialises request/reply pairs
    };

  } // namespace core
} // namespace hvload
