#pragma once
/** @file  DischargeProfile.hpp
 *  @brief Step, stop-condition and profile value types.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cstdint>
#include <string>
#include <vector>

namespace hvload::core {

  enum class StepKind : std::uint8_t { ConstantCurrent, ConstantPower, ConstantVoltage };
  enum class StopMetric : std::uint8_t { Voltage, Current };

  inline const char* toString(StepKind k) {
    switch (k) {
    case StepKind::ConstantCurrent:
      return "CC";
    case StepKind::ConstantPower:
      return "CP";
    case StepKind::ConstantVoltage:
      return "CV";
    default:
      return "Unknown";
    }
  }

  inline const char* unitOf(StepKind k) {
    switch (k) {
    case StepKind::ConstantCurrent:
      return "A";
    case StepKind::ConstantPower:
      return "W";
    case StepKind::ConstantVoltage:
      return "V";
    default:
      return "";
    }
  }

  inline const char* toString(StopMetric m) { return m == StopMetric::Voltage ? "voltage" : "current"; }

  /**
 * @struct StopCondition
 * @brief Ends a step once the chosen metric falls to or below the threshold.
 */
  struct StopCondition {
    StopMetric metric{ StopMetric::Voltage };
    double threshold{ 0.0 };

    bool isMet(double voltage, double current) const {
      const double value = metric == StopMetric::Voltage ? voltage : current;
      return value <= threshold;
    }
  };

  struct Step {
    StepKind kind{ StepKind::ConstantCurrent };
    double magnitude{ 0.0 }; ///< A, W or V depending on kind
    StopCondition stop{};
  };

  struct DischargeProfile {
    std::string name;
    std::vector<Step> steps;
  };

  /// Human-readable one-liner, e.g. "CC 10 A until V <= 350".
  std::string describe(const Step& step);

} // namespace hvload::core
