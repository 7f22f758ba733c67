#include <gtest/gtest.h>
#include "framework/exchange/decision.hpp"
#include "framework/exception/errors.hpp"

using namespace plugrt::framework;

TEST(DecisionTest, PassContinuesWithoutMutation)
{
  auto decision = Decision::pass();
  EXPECT_TRUE(decision.continues());
  EXPECT_FALSE(decision.is_mutation());
  EXPECT_FALSE(decision.short_circuit_status().has_value());
  EXPECT_TRUE(decision.short_circuit_body().empty());
}

TEST(DecisionTest, MutateCarriesEnvelope)
{
  auto envelope = Envelope::request("GET", "/");
  envelope.headers.add("X-Added", "1");

  auto decision = Decision::mutate(envelope);
  EXPECT_TRUE(decision.continues());
  ASSERT_TRUE(decision.is_mutation());
  EXPECT_EQ(*decision.mutated_envelope(), envelope);
  EXPECT_FALSE(decision.short_circuit_status().has_value());
}

TEST(DecisionTest, ShortCircuitCarriesResponse)
{
  auto decision = Decision::short_circuit(403, "forbidden", HeaderMap{{"Content-Type", "text/plain"}});
  EXPECT_FALSE(decision.continues());
  EXPECT_FALSE(decision.is_mutation());
  EXPECT_EQ(decision.short_circuit_status().value_or(0), 403);
  EXPECT_EQ(decision.short_circuit_body(), "forbidden");
  EXPECT_EQ(decision.short_circuit_headers().get("content-type").value_or(""), "text/plain");
}

TEST(DecisionTest, ShortCircuitRejectsInvalidStatus)
{
  EXPECT_THROW(Decision::short_circuit(0), ProtocolError);
  EXPECT_THROW(Decision::short_circuit(99), ProtocolError);
  EXPECT_THROW(Decision::short_circuit(600), ProtocolError);
  EXPECT_NO_THROW(Decision::short_circuit(100));
  EXPECT_NO_THROW(Decision::short_circuit(599));
}

TEST(DecisionTest, ValidatePassAndShortCircuit)
{
  EXPECT_NO_THROW(validate_decision(Decision::pass(), Stage::Request));
  EXPECT_NO_THROW(validate_decision(Decision::pass(), Stage::Response));
  EXPECT_NO_THROW(validate_decision(Decision::short_circuit(401), Stage::Request));
}

TEST(DecisionTest, MutationMustKeepStage)
{
  auto decision = Decision::mutate(Envelope::response(200));
  EXPECT_THROW(validate_decision(decision, Stage::Request), ProtocolError);
  EXPECT_NO_THROW(validate_decision(decision, Stage::Response));
}

TEST(DecisionTest, MutationMustBeValidEnvelope)
{
  auto broken = Envelope::request("GET", "/");
  broken.method.reset();
  EXPECT_THROW(validate_decision(Decision::mutate(broken), Stage::Request), ProtocolError);
}

TEST(DecisionTest, ResponseMutationMayChangeStatus)
{
  auto mutated = Envelope::response(200);
  mutated.status_code = 404;
  EXPECT_NO_THROW(validate_decision(Decision::mutate(mutated), Stage::Response));

  mutated.status_code = 700;
  EXPECT_THROW(validate_decision(Decision::mutate(mutated), Stage::Response), ProtocolError);
}

TEST(DecisionTest, Equality)
{
  EXPECT_EQ(Decision::pass(), Decision::pass());
  EXPECT_NE(Decision::pass(), Decision::short_circuit(200));
  EXPECT_EQ(Decision::short_circuit(401, "x"), Decision::short_circuit(401, "x"));
  EXPECT_NE(Decision::short_circuit(401, "x"), Decision::short_circuit(401, "y"));
}
