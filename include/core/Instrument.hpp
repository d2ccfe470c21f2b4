#pragma once
/** @file  Instrument.hpp
 *  @brief Capability set shared by the real load and the test-mode simulator.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

// HVLoad headers
#include "core/DischargeProfile.hpp"

namespace hvload::core {

  enum class ConnectionState : std::uint8_t { Disconnected, Connecting, Connected, Faulted };

  inline const char* toString(ConnectionState s) {
    switch (s) {
    case ConnectionState::Disconnected:
      return "Disconnected";
    case ConnectionState::Connecting:
      return "Connecting";
    case ConnectionState::Connected:
      return "Connected";
    case ConnectionState::Faulted:
      return "Faulted";
    default:
      return "Unknown";
    }
  }

  struct Measurement {
    double voltage{ 0.0 }; ///< V
    double current{ 0.0 }; ///< A
  };

  /// One-shot readout for the calibration check; reading it does not advance anything.
  struct InstrumentStatus {
    Measurement reading;
    double power{ 0.0 }; ///< W, as reported by the load
    bool inputOn{ false };
    std::string function; ///< active load function, e.g. "CC"
  };

  struct FaultCode {
    int code{ 0 };
    std::string message;
  };

  /**
 * @class Instrument
 * @brief Electronic-load control interface.
 *
 *  * Every call may block up to the implementation's own deadline.
 *  * Failures are thrown as the DischargeError family (core/Errors.hpp).
 *  * DischargeEngine talks only to this interface.
 */
  class Instrument {
  public:
    using AbortCheck = std::function<bool()>;

    virtual ~Instrument() = default;

    virtual void connect(const std::string& address, std::uint16_t port) = 0;

    /// Switch the input off, then close.
    virtual void disconnect() = 0;

    /// Close without sending anything.
    virtual void release() = 0;

    /// Select CC/CP/CV and program its level.
    virtual void setMode(StepKind kind, double magnitude) = 0;

    /// Load input on/off; off is both the pause and the safe-shutdown command.
    virtual void setInputEnabled(bool on) = 0;

    virtual Measurement queryMeasurement() = 0;

    virtual InstrumentStatus queryStatus() = 0;

    /// nullopt while the device reports no fault.
    virtual std::optional<FaultCode> queryFault() = 0;

    /// Identification string cached at connect time.
    virtual std::string identity() const = 0;

    virtual ConnectionState connectionState() const = 0;

    /// Polled while retrying; returning true makes the pending call throw AbortedError.
    virtual void setAbortCheck(AbortCheck check) = 0;
  };

} // namespace hvload::core
