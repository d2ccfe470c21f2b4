/* @file ParameterStore.cpp
 * @brief live readout values
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

#include "core/ParameterStore.hpp"
#include "core/Session.hpp"

namespace hvload {
  namespace core {

    void ParameterStore::set(Parameter p, double value) {
      std::lock_guard<std::mutex> lock(mtx_);
      values_[p] = value;
    }

    double ParameterStore::get(Parameter p) const {
      std::lock_guard<std::mutex> lock(mtx_);
      auto it = values_.find(p);
      return it == values_.end() ? 0.0 : it->second;
    }

    bool ParameterStore::hasData() const {
      std::lock_guard<std::mutex> lock(mtx_);
      return !values_.empty();
    }

    void ParameterStore::publish(const Sample& sample) {
      std::lock_guard<std::mutex> lock(mtx_);
      values_[Parameter::Voltage] = sample.voltage;
      values_[Parameter::Current] = sample.current;
      values_[Parameter::Power] = sample.power;
      values_[Parameter::Energy] = sample.cumulativeEnergyJ;
      values_[Parameter::Step] = static_cast<double>(sample.stepIndex + 1);
      values_[Parameter::Elapsed] = sample.elapsedS;
    }

  } // namespace core
} // namespace hvload
