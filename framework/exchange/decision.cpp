// framework/exchange/decision.cpp
#include "decision.hpp"
#include "exception/errors.hpp"

#include <fmt/core.h>

namespace plugrt::framework
{
  Decision Decision::pass()
  {
    return Decision{};
  }

  Decision Decision::mutate(Envelope mutated)
  {
    Decision decision;
    decision.mutated_envelope_ = std::move(mutated);
    return decision;
  }

  Decision Decision::short_circuit(int status, std::string body, HeaderMap headers)
  {
    if (!is_valid_status(status))
    {
      throw ProtocolError(fmt::format("short-circuit status {} is outside 100-599", status));
    }
    Decision decision;
    decision.continue_ = false;
    decision.short_circuit_status_ = status;
    decision.short_circuit_body_ = std::move(body);
    decision.short_circuit_headers_ = std::move(headers);
    return decision;
  }

  bool Decision::operator==(const Decision& other) const
  {
    return continue_ == other.continue_ &&
      mutated_envelope_ == other.mutated_envelope_ &&
      short_circuit_status_ == other.short_circuit_status_ &&
      short_circuit_body_ == other.short_circuit_body_ &&
      short_circuit_headers_ == other.short_circuit_headers_;
  }

  void validate_decision(const Decision& decision, Stage stage)
  {
    // short-circuit status is checked by Decision::short_circuit already
    const auto& mutated = decision.mutated_envelope();
    if (!decision.continues() || !mutated)
    {
      return;
    }
    if (mutated->stage != stage)
    {
      throw ProtocolError(fmt::format("mutated envelope has stage {} but the call was {}",
                                      to_string(mutated->stage), to_string(stage)));
    }
    validate_envelope(*mutated);
  }
}
