#pragma once
/** @file  ScpiCodec.hpp
 *  @brief Stateless encoder/decoder for the N69200 load's SCPI dialect.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <optional>
#include <string>
#include <string_view>

// HVLoad headers
#include "core/DischargeProfile.hpp"
#include "protocols/Command.hpp"
#include "protocols/Response.hpp"

namespace hvload::protocols::scpi {

  /// Decoded `SYSTem:ERRor?` reply. Code 0 means the queue is empty.
  struct ErrorEntry {
    int code{ 0 };
    std::string message;
  };

  //---encoders-----------------------------------------------------------
  Command identify();                                      ///< *IDN?
  Command setFunction(core::StepKind kind);                ///< INPut:FUNCtion CC
  Command setLevel(core::StepKind kind, double magnitude); ///< STATic:CC:HIGH:LEVel 10.000
  Command setInputState(bool on);                          ///< INPut:STATe 1
  Command queryInputState();                               ///< INPut:STATe?
  Command queryFunction();                                 ///< INPut:FUNCtion?
  Command measureVoltage();                                ///< MEASure:VOLTage?
  Command measureCurrent();                                ///< MEASure:CURRent?
  Command measurePower();                                  ///< MEASure:POWer?
  Command queryError();                                    ///< SYSTem:ERRor?

  //---decoders (nullopt == malformed) ------------------------------------
  /// Number with an optional unit suffix, e.g. "399.870 V" or "1.2E+1".
  std::optional<double> parseMeasurement(const Response& reply, std::string_view unit);

  /// `<code>,"<message>"`; a bare code is accepted too.
  std::optional<ErrorEntry> parseError(const Response& reply);

  /// "1"/"ON" or "0"/"OFF".
  std::optional<bool> parseInputState(const Response& reply);

  /// Maps the numeric `INPut:FUNCtion?` reply to its mode name ("CC", "CV", ...).
  std::string functionName(const Response& reply);

} // namespace hvload::protocols::scpi
