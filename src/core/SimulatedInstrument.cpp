/* @file SimulatedInstrument.cpp
 * @brief decay model used in test mode
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <iostream>

// HVLoad headers
#include "core/Errors.hpp"
#include "core/SimulatedInstrument.hpp"

namespace hvload::core {

  namespace {
    constexpr double kDeadBatteryVoltage = 1.0; // below this the load draws nothing
    constexpr double kCvMinCurrent = 0.01;
  } // namespace

  SimulatedInstrument::SimulatedInstrument(SimulationSettings settings)
      : settings_(settings), voltage_(settings.initialVoltage),
        cvCurrent_(settings.cvCurrentStart), rng_(settings.seed) {}

  void SimulatedInstrument::connect(const std::string&, std::uint16_t) {
    std::lock_guard<std::mutex> lock(mtx_);
    connected_ = true;
    inputOn_ = false;
    voltage_ = settings_.initialVoltage;
    current_ = 0.0;
    cvCurrent_ = settings_.cvCurrentStart;
    measurements_ = 0;
    rng_.seed(settings_.seed);
    std::cerr << "[SimulatedInstrument] test mode, V0=" << voltage_ << " V\n";
  }

  void SimulatedInstrument::disconnect() {
    std::lock_guard<std::mutex> lock(mtx_);
    connected_ = false;
    inputOn_ = false;
  }

  void SimulatedInstrument::release() {
    std::lock_guard<std::mutex> lock(mtx_);
    connected_ = false;
  }

  void SimulatedInstrument::setMode(StepKind kind, double magnitude) {
    std::lock_guard<std::mutex> lock(mtx_);
    requireConnected("setMode");
    if (kind == StepKind::ConstantVoltage && kind_ != StepKind::ConstantVoltage)
      cvCurrent_ = settings_.cvCurrentStart;
    kind_ = kind;
    magnitude_ = magnitude;
  }

  void SimulatedInstrument::setInputEnabled(bool on) {
    std::lock_guard<std::mutex> lock(mtx_);
    requireConnected("setInputEnabled");
    inputOn_ = on;
    if (!on)
      current_ = 0.0;
  }

  Measurement SimulatedInstrument::queryMeasurement() {
    std::lock_guard<std::mutex> lock(mtx_);
    if (abortCheck_ && abortCheck_())
      throw AbortedError("MEASure:VOLTage?");
    requireConnected("queryMeasurement");

    ++measurements_;
    if (inputOn_)
      advance();
    return Measurement{ voltage_, inputOn_ ? current_ : 0.0 };
  }

  InstrumentStatus SimulatedInstrument::queryStatus() {
    std::lock_guard<std::mutex> lock(mtx_);
    requireConnected("queryStatus");
    InstrumentStatus status;
    status.reading = Measurement{ voltage_, inputOn_ ? current_ : 0.0 };
    status.power = status.reading.voltage * status.reading.current;
    status.inputOn = inputOn_;
    status.function = toString(kind_);
    return status;
  }

  std::optional<FaultCode> SimulatedInstrument::queryFault() {
    std::lock_guard<std::mutex> lock(mtx_);
    requireConnected("queryFault");
    if (settings_.faultAfterMeasurements && measurements_ >= *settings_.faultAfterMeasurements)
      return settings_.injectedFault;
    return std::nullopt;
  }

  std::string SimulatedInstrument::identity() const {
    return "Simulated Instrument, Model Test, S/N 12345";
  }

  ConnectionState SimulatedInstrument::connectionState() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return connected_ ? ConnectionState::Connected : ConnectionState::Disconnected;
  }

  void SimulatedInstrument::setAbortCheck(AbortCheck check) {
    std::lock_guard<std::mutex> lock(mtx_);
    abortCheck_ = std::move(check);
  }

  double SimulatedInstrument::voltage() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return voltage_;
  }

  bool SimulatedInstrument::inputEnabled() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return inputOn_;
  }

  void SimulatedInstrument::advance() {
    const double noise = settings_.noiseFraction;
    const bool linear = settings_.decayPerTick > 0.0;
    std::uniform_real_distribution<double> rel(-noise, noise);
    std::uniform_real_distribution<double> sag(0.01, 0.05);
    std::uniform_real_distribution<double> wobble(-0.05, 0.05);

    auto noisy = [&](double v) { return noise > 0.0 ? v * (1.0 + rel(rng_)) : v; };
    auto drift = [&](std::uniform_real_distribution<double>& d) {
      return noise > 0.0 ? d(rng_) : 0.0;
    };

    switch (kind_) {
    case StepKind::ConstantCurrent:
      current_ = noisy(magnitude_);
      if (linear)
        voltage_ -= settings_.decayPerTick;
      else
        voltage_ -= current_ * settings_.resistanceFactor + drift(sag);
      break;

    case StepKind::ConstantPower: {
      const double power = noisy(magnitude_);
      if (linear) {
        voltage_ -= settings_.decayPerTick;
        current_ = voltage_ > kDeadBatteryVoltage ? power / voltage_ : 0.0;
      } else {
        current_ = voltage_ > kDeadBatteryVoltage ? power / voltage_ : 0.0;
        voltage_ -= current_ * settings_.resistanceFactor * 0.5 + drift(sag);
      }
      break;
    }

    case StepKind::ConstantVoltage:
      if (linear)
        voltage_ -= settings_.decayPerTick;
      else
        voltage_ += (magnitude_ - voltage_) * 0.1 + drift(wobble);
      cvCurrent_ = std::max(kCvMinCurrent, cvCurrent_ * (1.0 - settings_.cvCurrentDecay));
      current_ = noisy(cvCurrent_);
      break;
    }

    voltage_ = std::max(0.0, voltage_);
    if (voltage_ < kDeadBatteryVoltage)
      current_ = 0.0;
  }

  void SimulatedInstrument::requireConnected(const char* what) const {
    if (!connected_)
      throw ConnectionError(std::string("[SimulatedInstrument] ") + what + " while disconnected");
  }

} // namespace hvload::core
