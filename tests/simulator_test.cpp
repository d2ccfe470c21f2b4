// HVLoad-Prod headers
#include "core/Errors.hpp"
#include "core/SimulatedInstrument.hpp"

// GTest headers
#include <gtest/gtest.h>

namespace hvload::test {

  using core::SimulatedInstrument;
  using core::SimulationSettings;
  using core::StepKind;

  SimulationSettings linearSettings() {
    SimulationSettings s;
    s.initialVoltage = 400.0;
    s.decayPerTick = 5.0;
    s.noiseFraction = 0.0;
    return s;
  }

  TEST(simulated_instrument, requires_connect) {
    SimulatedInstrument sim(linearSettings());
    EXPECT_THROW(sim.setInputEnabled(true), core::ConnectionError);
    EXPECT_THROW(sim.queryMeasurement(), core::ConnectionError);
  }

  TEST(simulated_instrument, linear_decay_only_while_input_on) {
    SimulatedInstrument sim(linearSettings());
    sim.connect("sim", 0);
    sim.setMode(StepKind::ConstantCurrent, 10.0);

    auto idle = sim.queryMeasurement();
    EXPECT_DOUBLE_EQ(idle.voltage, 400.0);
    EXPECT_DOUBLE_EQ(idle.current, 0.0);

    sim.setInputEnabled(true);
    auto m1 = sim.queryMeasurement();
    EXPECT_DOUBLE_EQ(m1.voltage, 395.0);
    EXPECT_DOUBLE_EQ(m1.current, 10.0);
    auto m2 = sim.queryMeasurement();
    EXPECT_DOUBLE_EQ(m2.voltage, 390.0);

    sim.setInputEnabled(false);
    auto paused = sim.queryMeasurement();
    EXPECT_DOUBLE_EQ(paused.voltage, 390.0);
    EXPECT_DOUBLE_EQ(paused.current, 0.0);
  }

  TEST(simulated_instrument, constant_power_current_follows_voltage) {
    SimulatedInstrument sim(linearSettings());
    sim.connect("sim", 0);
    sim.setMode(StepKind::ConstantPower, 2000.0);
    sim.setInputEnabled(true);

    auto m = sim.queryMeasurement();
    EXPECT_DOUBLE_EQ(m.voltage, 395.0);
    EXPECT_NEAR(m.voltage * m.current, 2000.0, 1e-9);
  }

  TEST(simulated_instrument, constant_voltage_current_tapers) {
    SimulationSettings s;
    s.noiseFraction = 0.0;
    s.cvCurrentStart = 5.0;
    s.cvCurrentDecay = 0.5;
    SimulatedInstrument sim(s);
    sim.connect("sim", 0);
    sim.setMode(StepKind::ConstantVoltage, 380.0);
    sim.setInputEnabled(true);

    double last = s.cvCurrentStart;
    for (int i = 0; i < 5; ++i) {
      auto m = sim.queryMeasurement();
      EXPECT_LT(m.current, last);
      last = m.current;
    }
    EXPECT_NEAR(last, 5.0 * 0.03125, 1e-9);
  }

  TEST(simulated_instrument, resistive_model_sags_and_is_reproducible) {
    SimulationSettings s; // resistive model, default noise
    SimulatedInstrument a(s);
    SimulatedInstrument b(s);
    for (auto* sim : { &a, &b }) {
      sim->connect("sim", 0);
      sim->setMode(StepKind::ConstantCurrent, 20.0);
      sim->setInputEnabled(true);
    }

    double prev = s.initialVoltage;
    for (int i = 0; i < 10; ++i) {
      auto ma = a.queryMeasurement();
      auto mb = b.queryMeasurement();
      EXPECT_LT(ma.voltage, prev);
      EXPECT_DOUBLE_EQ(ma.voltage, mb.voltage); // same seed, same trace
      prev = ma.voltage;
    }
  }

  TEST(simulated_instrument, status_reads_without_advancing) {
    SimulatedInstrument sim(linearSettings());
    sim.connect("sim", 0);
    sim.setMode(StepKind::ConstantPower, 2000.0);
    sim.setInputEnabled(true);
    sim.queryMeasurement();

    auto status = sim.queryStatus();
    EXPECT_DOUBLE_EQ(status.reading.voltage, 395.0);
    EXPECT_NEAR(status.power, 2000.0, 1e-9);
    EXPECT_TRUE(status.inputOn);
    EXPECT_EQ(status.function, "CP");
    EXPECT_DOUBLE_EQ(sim.voltage(), 395.0);

    sim.release();
    EXPECT_THROW(sim.queryStatus(), core::ConnectionError);
  }

  TEST(simulated_instrument, injected_fault_after_count) {
    SimulationSettings s = linearSettings();
    s.faultAfterMeasurements = 2;
    SimulatedInstrument sim(s);
    sim.connect("sim", 0);

    sim.queryMeasurement();
    EXPECT_FALSE(sim.queryFault());
    sim.queryMeasurement();
    auto fault = sim.queryFault();
    ASSERT_TRUE(fault);
    EXPECT_EQ(fault->code, -310);
  }

  TEST(simulated_instrument, abort_check_interrupts_measurement) {
    SimulatedInstrument sim(linearSettings());
    sim.connect("sim", 0);
    bool stop = true;
    sim.setAbortCheck([&] { return stop; });
    EXPECT_THROW(sim.queryMeasurement(), core::AbortedError);
    stop = false;
    EXPECT_NO_THROW(sim.queryMeasurement());
  }

  TEST(simulated_instrument, connect_resets_model) {
    SimulatedInstrument sim(linearSettings());
    sim.connect("sim", 0);
    sim.setMode(StepKind::ConstantCurrent, 10.0);
    sim.setInputEnabled(true);
    sim.queryMeasurement();
    ASSERT_DOUBLE_EQ(sim.voltage(), 395.0);

    sim.connect("sim", 0);
    EXPECT_DOUBLE_EQ(sim.voltage(), 400.0);
    EXPECT_FALSE(sim.inputEnabled());
    EXPECT_EQ(sim.identity(), "Simulated Instrument, Model Test, S/N 12345");
  }

} // namespace hvload::test
