// framework/rpc/wire_codec.hpp
#ifndef PLUGRT_FRAMEWORK_RPC_WIRE_CODEC_HPP
#define PLUGRT_FRAMEWORK_RPC_WIRE_CODEC_HPP

#include "capability/capability_descriptor.hpp"
#include "exchange/decision.hpp"
#include "exchange/envelope.hpp"
#include "plugrt/v1/plugin.pb.h"

namespace plugrt::framework::rpc
{
  namespace pb = ::plugrt::v1;

  // Conversions between protobuf messages and runtime types. Every decode_* throws
  // ProtocolError when the message cannot represent a valid value.

  Stage decode_stage(pb::Stage stage);
  pb::Stage encode_stage(Stage stage);

  FailurePolicy decode_failure_policy(pb::FailurePolicy policy);
  pb::FailurePolicy encode_failure_policy(FailurePolicy policy);

  Envelope decode_envelope(const pb::Envelope& message);
  void encode_envelope(const Envelope& envelope, pb::Envelope* message);

  Decision decode_decision(const pb::Decision& message);
  void encode_decision(const Decision& decision, pb::Decision* message);

  CapabilityDescriptor decode_descriptor(const pb::CapabilityDescriptor& message);
  void encode_descriptor(const CapabilityDescriptor& descriptor, pb::CapabilityDescriptor* message);
}

#endif // PLUGRT_FRAMEWORK_RPC_WIRE_CODEC_HPP
