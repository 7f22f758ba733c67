// framework/exchange/decision.hpp
#ifndef PLUGRT_FRAMEWORK_EXCHANGE_DECISION_HPP_
#define PLUGRT_FRAMEWORK_EXCHANGE_DECISION_HPP_

#include "envelope.hpp"
#include <optional>
#include <string>

namespace plugrt::framework
{
  /**
   * @brief A plugin's verdict on one envelope.
   *
   * Only the factories create a Decision, so every instance already satisfies the
   * protocol: a short-circuit always carries a status in 100-599, and a mutated
   * envelope is only present on a continue.
   */
  class Decision
  {
  public:
    // continue, host keeps its original envelope
    static Decision pass();

    // continue with the given envelope replacing the original
    static Decision mutate(Envelope mutated);

    /**
     * @brief Stop the pipeline and answer the client directly.
     * @throws ProtocolError if status is outside 100-599.
     */
    static Decision short_circuit(int status, std::string body = {}, HeaderMap headers = {});

    bool continues() const { return continue_; }
    bool is_mutation() const { return mutated_envelope_.has_value(); }

    const std::optional<Envelope>& mutated_envelope() const { return mutated_envelope_; }
    std::optional<int> short_circuit_status() const { return short_circuit_status_; }
    const std::string& short_circuit_body() const { return short_circuit_body_; }
    const HeaderMap& short_circuit_headers() const { return short_circuit_headers_; }

    bool operator==(const Decision& other) const;
    bool operator!=(const Decision& other) const { return !(*this == other); }

  private:
    Decision() = default;

    bool continue_ = true;
    std::optional<Envelope> mutated_envelope_;
    std::optional<int> short_circuit_status_;
    std::string short_circuit_body_;
    HeaderMap short_circuit_headers_;
  };

  /**
   * @brief Checks that a handler's Decision fits the stage it was produced for.
   *
   * A mutated envelope must keep the stage of the call and be a valid envelope for it.
   * A RESPONSE mutation may change status_code as long as it stays within 100-599.
   * @throws ProtocolError on violation.
   */
  void validate_decision(const Decision& decision, Stage stage);
}

#endif // PLUGRT_FRAMEWORK_EXCHANGE_DECISION_HPP_
