/* @file ProfileModel.cpp
 * @brief profile validation and step formatting
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cmath>
#include <sstream>

// HVLoad headers
#include "core/Errors.hpp"
#include "core/ProfileModel.hpp"

namespace hvload::core {

  std::string describe(const Step& step) {
    std::ostringstream os;
    os << toString(step.kind) << ' ' << step.magnitude << ' ' << unitOf(step.kind) << " until "
       << (step.stop.metric == StopMetric::Voltage ? "V" : "I") << " <= " << step.stop.threshold
       << (step.stop.metric == StopMetric::Voltage ? " V" : " A");
    return os.str();
  }

  ValidatedProfile ProfileModel::validate(DischargeProfile profile) const {
    if (profile.steps.empty())
      throw ValidationError("profile '" + profile.name + "' has no steps");

    for (std::size_t i = 0; i < profile.steps.size(); ++i)
      validateStep(profile.steps[i], i);

    return ValidatedProfile(std::move(profile));
  }

  void ProfileModel::validateStep(const Step& step, std::size_t index) const {
    const std::string where = "step " + std::to_string(index + 1) + ": ";

    if (!std::isfinite(step.magnitude) || step.magnitude <= 0.0)
      throw ValidationError(where + "magnitude must be > 0", index);

    const double threshold = step.stop.threshold;
    if (!std::isfinite(threshold) || threshold < 0.0)
      throw ValidationError(where + "stop threshold must be >= 0", index);

    if (step.stop.metric == StopMetric::Voltage) {
      if (expected_.voltage && threshold >= *expected_.voltage) {
        std::ostringstream os;
        os << where << "voltage threshold " << threshold << " V is not below the starting voltage "
           << *expected_.voltage << " V";
        throw ValidationError(os.str(), index);
      }
      return;
    }

    // current stop: compare with what this step is expected to draw at first
    std::optional<double> startCurrent;
    if (step.kind == StepKind::ConstantCurrent)
      startCurrent = step.magnitude;
    else if (step.kind == StepKind::ConstantVoltage)
      startCurrent = expected_.cvStartCurrent;

    if (startCurrent && threshold >= *startCurrent) {
      std::ostringstream os;
      os << where << "current threshold " << threshold << " A is not below the starting current "
         << *startCurrent << " A";
      throw ValidationError(os.str(), index);
    }
  }

} // namespace hvload::core
