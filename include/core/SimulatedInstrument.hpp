#pragma once
/** @file  SimulatedInstrument.hpp
 *  @brief Test-mode stand-in for the electronic load (no network).
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <random>
#include <string>

// HVLoad headers
#include "core/Instrument.hpp"

namespace hvload::core {

  struct SimulationSettings {
    double initialVoltage{ 400.0 };
    double decayPerTick{ 0.0 }; ///< > 0 selects the linear (deterministic) decay model
    double resistanceFactor{ 0.01 };
    double noiseFraction{ 0.02 }; ///< relative current/power noise, 0 disables all noise
    double cvCurrentStart{ 5.0 };
    double cvCurrentDecay{ 0.05 }; ///< fraction lost per tick in CV
    std::uint32_t seed{ 12345 };
    std::optional<std::size_t> faultAfterMeasurements{}; ///< report a fault from this count on
    FaultCode injectedFault{ -310, "System error" };
  };

  /**
 * @class SimulatedInstrument
 * @brief Battery + load model advanced once per measurement while the input is on.
 *
 *  * Linear model: voltage drops by a fixed amount per measurement.
 *  * Resistive model: voltage sags with the drawn current plus a little noise.
 *  * Nothing decays while the input is off; current then reads 0.
 */
  class SimulatedInstrument : public Instrument {
  public:
    explicit SimulatedInstrument(SimulationSettings settings = {});

    void connect(const std::string& address, std::uint16_t port) override;
    void disconnect() override;
    void release() override;
    void setMode(StepKind kind, double magnitude) override;
    void setInputEnabled(bool on) override;
    Measurement queryMeasurement() override;
    InstrumentStatus queryStatus() override;
    std::optional<FaultCode> queryFault() override;
    std::string identity() const override;
    ConnectionState connectionState() const override;
    void setAbortCheck(AbortCheck check) override;

    /// Model voltage without advancing the model.
    double voltage() const;
    bool inputEnabled() const;

  private:
    void advance();
    void requireConnected(const char* what) const;

    SimulationSettings settings_;
    mutable std::mutex mtx_;
    AbortCheck abortCheck_{};

    bool connected_{ false };
    bool inputOn_{ false };
    StepKind kind_{ StepKind::ConstantCurrent };
    double magnitude_{ 0.0 };

    double voltage_;
    double current_{ 0.0 };
    double cvCurrent_;
    std::size_t measurements_{ 0 };
    std::mt19937 rng_;
  };

} // namespace hvload::core
