#pragma once
/** @file  Errors.hpp
 *  @brief Typed exception hierarchy shared by the link, the simulator and the engine.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cstddef>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>

namespace hvload {
  namespace core {

    enum class ErrorKind : std::uint8_t {
      Connection,
      Protocol,
      Timeout,
      DeviceFault,
      Validation,
      State,
      Aborted
    };

    inline const char* toString(ErrorKind k) {
      switch (k) {
      case ErrorKind::Connection:
        return "ConnectionError";
      case ErrorKind::Protocol:
        return "ProtocolError";
      case ErrorKind::Timeout:
        return "TimeoutError";
      case ErrorKind::DeviceFault:
        return "DeviceFaultError";
      case ErrorKind::Validation:
        return "ValidationError";
      case ErrorKind::State:
        return "StateError";
      case ErrorKind::Aborted:
        return "AbortedError";
      default:
        return "Unknown";
      }
    }

    /**
 * @class DischargeError
 * @brief Base of every error the control stack throws.
 *
 *  * `context()` holds the offending command, reply or measurement text.
 *  * `stepIndex()` is set once the error is known to belong to a profile step.
 */
    class DischargeError : public std::runtime_error {
    public:
      DischargeError(ErrorKind kind, const std::string& message, std::string context = {},
                     std::optional<std::size_t> stepIndex = std::nullopt)
          : std::runtime_error(message), kind_(kind), context_(std::move(context)),
            stepIndex_(stepIndex) {}

      ErrorKind kind() const noexcept { return kind_; }
      const std::string& context() const noexcept { return context_; }
      std::optional<std::size_t> stepIndex() const noexcept { return stepIndex_; }

    private:
      ErrorKind kind_;
      std::string context_;
      std::optional<std::size_t> stepIndex_;
    };

    /// Instrument unreachable, refused, or lost while a command was being sent.
    class ConnectionError : public DischargeError {
    public:
      explicit ConnectionError(const std::string& message, std::string context = {})
          : DischargeError(ErrorKind::Connection, message, std::move(context)) {}
    };

    /// Reply could not be decoded. Never retried.
    class ProtocolError : public DischargeError {
    public:
      explicit ProtocolError(const std::string& message, std::string context = {})
          : DischargeError(ErrorKind::Protocol, message, std::move(context)) {}
    };

    /// No reply within the deadline after the retry budget was spent.
    class TimeoutError : public DischargeError {
    public:
      TimeoutError(const std::string& message, std::string context, unsigned attempts)
          : DischargeError(ErrorKind::Timeout, message, std::move(context)), attempts_(attempts) {}

      unsigned attempts() const noexcept { return attempts_; }

    private:
      unsigned attempts_;
    };

    /// The instrument reported an internal fault through its error queue.
    class DeviceFaultError : public DischargeError {
    public:
      DeviceFaultError(int code, const std::string& deviceMessage)
          : DischargeError(ErrorKind::DeviceFault,
                           "instrument fault " + std::to_string(code) + ": " + deviceMessage,
                           deviceMessage),
            code_(code) {}

      int code() const noexcept { return code_; }

    private:
      int code_;
    };

    /// Profile, step or threshold rejected before a session starts.
    class ValidationError : public DischargeError {
    public:
      explicit ValidationError(const std::string& message,
                               std::optional<std::size_t> stepIndex = std::nullopt)
          : DischargeError(ErrorKind::Validation, message, {}, stepIndex) {}
    };

    /// Control command not valid in the current engine state.
    class StateError : public DischargeError {
    public:
      StateError(const std::string& command, const std::string& state)
          : DischargeError(ErrorKind::State, command + " not allowed in state " + state, command) {}
    };

    /// A pending operation was interrupted because Stop was requested.
    class AbortedError : public DischargeError {
    public:
      explicit AbortedError(std::string context)
          : DischargeError(ErrorKind::Aborted, "request aborted by stop", std::move(context)) {}
    };

  } // namespace core
} // namespace hvload
