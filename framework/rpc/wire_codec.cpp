// framework/rpc/wire_codec.cpp
#include "wire_codec.hpp"
#include "exception/errors.hpp"

#include <fmt/core.h>

namespace plugrt::framework::rpc
{
  namespace
  {
    HeaderMap decode_headers(const google::protobuf::RepeatedPtrField<pb::Header>& in)
    {
      HeaderMap headers;
      for (const auto& header : in)
      {
        headers.append_entry(header.name(), HeaderMap::Values(header.values().begin(), header.values().end()));
      }
      return headers;
    }

    void encode_headers(const HeaderMap& headers, google::protobuf::RepeatedPtrField<pb::Header>* out)
    {
      out->Clear();
      for (const auto& [name, values] : headers)
      {
        auto* header = out->Add();
        header->set_name(name);
        for (const auto& value : values)
        {
          header->add_values(value);
        }
      }
    }
  }

  Stage decode_stage(pb::Stage stage)
  {
    switch (stage)
    {
    case pb::STAGE_REQUEST:
      return Stage::Request;
    case pb::STAGE_RESPONSE:
      return Stage::Response;
    default:
      throw ProtocolError(fmt::format("unsupported stage value {}", static_cast<int>(stage)));
    }
  }

  pb::Stage encode_stage(Stage stage)
  {
    return stage == Stage::Response ? pb::STAGE_RESPONSE : pb::STAGE_REQUEST;
  }

  FailurePolicy decode_failure_policy(pb::FailurePolicy policy)
  {
    return policy == pb::FAILURE_POLICY_FAIL_OPEN ? FailurePolicy::FailOpen : FailurePolicy::FailClosed;
  }

  pb::FailurePolicy encode_failure_policy(FailurePolicy policy)
  {
    return policy == FailurePolicy::FailOpen ? pb::FAILURE_POLICY_FAIL_OPEN : pb::FAILURE_POLICY_FAIL_CLOSED;
  }

  Envelope decode_envelope(const pb::Envelope& message)
  {
    Envelope envelope;
    envelope.stage = decode_stage(message.stage());
    if (message.has_method())
    {
      envelope.method = message.method();
    }
    if (message.has_url())
    {
      envelope.url = message.url();
    }
    if (message.has_status_code())
    {
      envelope.status_code = message.status_code();
    }
    if (message.has_remote_addr())
    {
      envelope.remote_addr = message.remote_addr();
    }
    envelope.headers = decode_headers(message.headers());
    envelope.body = message.body();
    for (const auto& [key, value] : message.metadata())
    {
      envelope.metadata.emplace(key, value);
    }
    return envelope;
  }

  void encode_envelope(const Envelope& envelope, pb::Envelope* message)
  {
    message->Clear();
    message->set_stage(encode_stage(envelope.stage));
    if (envelope.method)
    {
      message->set_method(*envelope.method);
    }
    if (envelope.url)
    {
      message->set_url(*envelope.url);
    }
    if (envelope.status_code)
    {
      message->set_status_code(*envelope.status_code);
    }
    if (envelope.remote_addr)
    {
      message->set_remote_addr(*envelope.remote_addr);
    }
    encode_headers(envelope.headers, message->mutable_headers());
    message->set_body(envelope.body);
    auto& metadata = *message->mutable_metadata();
    for (const auto& [key, value] : envelope.metadata)
    {
      metadata[key] = value;
    }
  }

  Decision decode_decision(const pb::Decision& message)
  {
    if (message.continue_())
    {
      if (message.has_mutated_envelope())
      {
        return Decision::mutate(decode_envelope(message.mutated_envelope()));
      }
      return Decision::pass();
    }

    if (!message.has_short_circuit_status())
    {
      throw ProtocolError("short-circuit decision without a status");
    }
    return Decision::short_circuit(message.short_circuit_status(), message.short_circuit_body(),
                                   decode_headers(message.short_circuit_headers()));
  }

  void encode_decision(const Decision& decision, pb::Decision* message)
  {
    message->Clear();
    message->set_continue_(decision.continues());
    if (const auto& mutated = decision.mutated_envelope())
    {
      encode_envelope(*mutated, message->mutable_mutated_envelope());
    }
    if (auto status = decision.short_circuit_status())
    {
      message->set_short_circuit_status(*status);
      message->set_short_circuit_body(decision.short_circuit_body());
      encode_headers(decision.short_circuit_headers(), message->mutable_short_circuit_headers());
    }
  }

  CapabilityDescriptor decode_descriptor(const pb::CapabilityDescriptor& message)
  {
    CapabilityDescriptor descriptor(message.name(), message.version(), message.description());
    try
    {
      for (const auto& support : message.stages())
      {
        descriptor.support(decode_stage(support.stage()), decode_failure_policy(support.failure_policy()));
      }
    }
    catch (const ConfigurationError& e)
    {
      throw ProtocolError(e.what());
    }
    return descriptor;
  }

  void encode_descriptor(const CapabilityDescriptor& descriptor, pb::CapabilityDescriptor* message)
  {
    message->Clear();
    message->set_name(descriptor.name());
    message->set_version(descriptor.version());
    message->set_description(descriptor.description());
    for (const auto& support : descriptor.stages())
    {
      auto* out = message->add_stages();
      out->set_stage(encode_stage(support.stage));
      out->set_failure_policy(encode_failure_policy(support.failure_policy));
    }
  }
}
