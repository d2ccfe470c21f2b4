#pragma once
/** @file  Session.hpp
 *  @brief Sample, metadata and summary records produced by a discharge run.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

// HVLoad headers
#include "core/DischargeProfile.hpp"

namespace hvload::core {

  using WallClock = std::chrono::system_clock;

  constexpr double kJoulesPerKWh = 3.6e6;

  /// One tick of the sampling loop. Never mutated once appended.
  struct Sample {
    WallClock::time_point timestamp{};
    double elapsedS{ 0.0 }; ///< wall time since Start
    double voltage{ 0.0 };
    double current{ 0.0 };
    double power{ 0.0 };            ///< voltage * current
    double energyIncrementJ{ 0.0 }; ///< power * tick interval
    double cumulativeEnergyJ{ 0.0 };
    std::size_t stepIndex{ 0 };
  };

  /// Pass-through strings for the certificate; the engine never interprets them.
  struct SessionMetadata {
    std::string operatorName;
    std::string registration;
    std::string location;
    std::string comments;
  };

  enum class EndReason : std::uint8_t { ProfileComplete, UserStop };

  inline const char* toString(EndReason r) {
    return r == EndReason::ProfileComplete ? "profile complete" : "stopped by operator";
  }

  /// Handed to the certificate collaborator exactly once, at Completed.
  struct SessionSummary {
    DischargeProfile profile;
    SessionMetadata metadata;
    std::string instrument; ///< *IDN? of the load (or the simulator)
    bool testMode{ false };
    EndReason reason{ EndReason::ProfileComplete };
    WallClock::time_point startedAt{};
    WallClock::time_point endedAt{};
    double totalEnergyJ{ 0.0 };
    std::vector<Sample> samples;

    double totalEnergyKWh() const { return totalEnergyJ / kJoulesPerKWh; }
  };

  /// Local time, "2025-03-14T09:26:53.589".
  std::string formatIso8601(WallClock::time_point t);

  /// Local time for file names, "20250314_092653".
  std::string formatCompact(WallClock::time_point t);

} // namespace hvload::core
