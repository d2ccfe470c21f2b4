// HVLoad-Prod headers
#include "protocols/Command.hpp"
#include "protocols/Response.hpp"
#include "protocols/ScpiCodec.hpp"

// GTest headers
#include <gtest/gtest.h>

namespace hvload::test {

  using core::StepKind;
  using protocols::Response;
  namespace scpi = protocols::scpi;

  Response reply(const std::string& body) { return Response{ body }; }

  TEST(scpi_encode, mode_and_level_lines) {
    EXPECT_EQ(scpi::setFunction(StepKind::ConstantCurrent).toWire(), "INPut:FUNCtion CC\n");
    EXPECT_EQ(scpi::setFunction(StepKind::ConstantPower).payload, "INPut:FUNCtion CP");
    EXPECT_EQ(scpi::setLevel(StepKind::ConstantCurrent, 10).payload, "STATic:CC:HIGH:LEVel 10.000");
    EXPECT_EQ(scpi::setLevel(StepKind::ConstantVoltage, 380.25).payload,
              "STATic:CV:HIGH:LEVel 380.250");
    EXPECT_EQ(scpi::setInputState(true).payload, "INPut:STATe 1");
    EXPECT_EQ(scpi::setInputState(false).payload, "INPut:STATe 0");
  }

  TEST(scpi_encode, only_queries_expect_reply) {
    EXPECT_TRUE(scpi::measureVoltage().isQuery());
    EXPECT_TRUE(scpi::queryError().isQuery());
    EXPECT_TRUE(scpi::identify().isQuery());
    EXPECT_FALSE(scpi::setInputState(true).isQuery());
  }

  TEST(scpi_decode, response_strips_framing) {
    auto r = Response::fromWire("  399.870 V\r\n");
    ASSERT_TRUE(r);
    EXPECT_EQ(r->body, "399.870 V");

    EXPECT_FALSE(Response::fromWire("\r\n"));
    EXPECT_FALSE(Response::fromWire(std::string("12\x01", 3)));
  }

  TEST(scpi_decode, measurement_with_and_without_unit) {
    EXPECT_DOUBLE_EQ(*scpi::parseMeasurement(reply("399.870 V"), "V"), 399.870);
    EXPECT_DOUBLE_EQ(*scpi::parseMeasurement(reply("12.5A"), "A"), 12.5);
    EXPECT_DOUBLE_EQ(*scpi::parseMeasurement(reply("+1.2E+1"), "V"), 12.0);
    EXPECT_DOUBLE_EQ(*scpi::parseMeasurement(reply("3.5e-1 a"), "A"), 0.35);
  }

  TEST(scpi_decode, measurement_rejects_garbage) {
    EXPECT_FALSE(scpi::parseMeasurement(reply("ERR"), "V"));
    EXPECT_FALSE(scpi::parseMeasurement(reply("12.5 A"), "V"));
    EXPECT_FALSE(scpi::parseMeasurement(reply("1.2.3"), "V"));
    EXPECT_FALSE(scpi::parseMeasurement(reply(""), "V"));
  }

  TEST(scpi_decode, error_queue_entries) {
    auto none = scpi::parseError(reply("0,\"No error\""));
    ASSERT_TRUE(none);
    EXPECT_EQ(none->code, 0);
    EXPECT_EQ(none->message, "No error");

    auto fault = scpi::parseError(reply("-310, \"System error\""));
    ASSERT_TRUE(fault);
    EXPECT_EQ(fault->code, -310);
    EXPECT_EQ(fault->message, "System error");

    auto bare = scpi::parseError(reply("+0"));
    ASSERT_TRUE(bare);
    EXPECT_EQ(bare->code, 0);

    EXPECT_FALSE(scpi::parseError(reply("No error")));
  }

  TEST(scpi_decode, input_state_and_function) {
    EXPECT_EQ(scpi::parseInputState(reply("1")), true);
    EXPECT_EQ(scpi::parseInputState(reply("off")), false);
    EXPECT_FALSE(scpi::parseInputState(reply("2")));

    EXPECT_EQ(scpi::functionName(reply("0")), "CC");
    EXPECT_EQ(scpi::functionName(reply("3")), "CP");
    EXPECT_EQ(scpi::functionName(reply("CV")), "CV");
  }

} // namespace hvload::test
