#pragma once
/** @file  ParameterStore.hpp
 *  @brief Thread-safe live readout shared by the sampling thread & the control surface.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <mutex>
#include <unordered_map>

#include "core/SessionSinks.hpp"

namespace hvload {
  namespace core {

    /**
 * @enum Parameter
 * @brief Strong-typed keys for every live value.
 */
    enum class Parameter {
      Voltage,
      Current,
      Power,
      Energy,  ///< J, cumulative
      Step,    ///< 1-based step number
      Elapsed, ///< s since Start
    };

    /** @class ParameterStore
 *  @brief Lock-protected map of <Parameter → double>, fed as a SampleSink.
 *
 *  * Written by the engine thread, read by the display / CLI thread.
 *  * Uses strong-typed key to avoid accidental string mismatches.
 */
    class ParameterStore : public SampleSink {

    public:
      ParameterStore() = default;
      ~ParameterStore() override = default;

      /// Atomically writes \p value under key \p p.
      void set(Parameter p, double value);

      /// Thread-safe getter; returns 0 if key missing.
      double get(Parameter p) const;

      /// True once at least one sample arrived.
      bool hasData() const;

      void publish(const Sample& sample) override;

    private:
      mutable std::mutex mtx_;
      std::unordered_map<Parameter, double> values_;
    };

  } // namespace core
} // namespace hvload
