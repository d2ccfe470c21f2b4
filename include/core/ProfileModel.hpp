#pragma once
/** @file  ProfileModel.hpp
 *  @brief Validates a DischargeProfile once, before the engine will accept it.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cstddef>
#include <optional>

// HVLoad headers
#include "core/DischargeProfile.hpp"

namespace hvload::core {

  /// Values the instrument is expected to show when a session starts (if known).
  struct ExpectedStart {
    std::optional<double> voltage;        ///< battery open-circuit voltage
    std::optional<double> cvStartCurrent; ///< initial current of a CV step
  };

  class ProfileModel;

  /**
 * @class ValidatedProfile
 * @brief A profile that passed ProfileModel::validate().
 *
 *  Only ProfileModel can construct one, so DischargeEngine::start() cannot be
 *  handed an unchecked profile.
 */
  class ValidatedProfile {
  public:
    const DischargeProfile& profile() const { return profile_; }
    const Step& step(std::size_t index) const { return profile_.steps.at(index); }
    std::size_t stepCount() const { return profile_.steps.size(); }

  private:
    friend class ProfileModel;
    explicit ValidatedProfile(DischargeProfile p) : profile_(std::move(p)) {}

    DischargeProfile profile_;
  };

  /**
 * @class ProfileModel
 * @brief Stateless validator; throws ValidationError naming the bad step.
 */
  class ProfileModel {
  public:
    ProfileModel() = default;
    explicit ProfileModel(ExpectedStart expected) : expected_(expected) {}

    ValidatedProfile validate(DischargeProfile profile) const;

  private:
    void validateStep(const Step& step, std::size_t index) const;

    ExpectedStart expected_{};
  };

} // namespace hvload::core
