#include "plugin_client.hpp"
#include "rpc/wire_codec.hpp"

#include <grpcpp/client_context.h>
#include <grpcpp/create_channel.h>
#include <grpcpp/security/credentials.h>
#include <fmt/core.h>

namespace plugrt::framework::client
{
  namespace
  {
    void check(const grpc::Status& status, const char* what)
    {
      if (!status.ok())
      {
        throw RpcError(status.error_code(), fmt::format("{} failed: {}", what, status.error_message()));
      }
    }
  }

  PluginClient::PluginClient(std::shared_ptr<grpc::Channel> channel)
    : channel_(std::move(channel)),
      stub_(pb::Plugin::NewStub(channel_))
  {
  }

  PluginClient::PluginClient(const std::string& target)
    : PluginClient(grpc::CreateChannel(target, grpc::InsecureChannelCredentials()))
  {
  }

  void PluginClient::set_timeout(std::chrono::milliseconds timeout)
  {
    timeout_ = timeout;
  }

  void PluginClient::prepare(grpc::ClientContext& context) const
  {
    context.set_deadline(std::chrono::system_clock::now() + timeout_);
    context.set_wait_for_ready(true);
  }

  CapabilityDescriptor PluginClient::describe() const
  {
    grpc::ClientContext context;
    prepare(context);
    google::protobuf::Empty request;
    pb::CapabilityDescriptor response;
    check(stub_->Describe(&context, request, &response), "Describe");
    return rpc::decode_descriptor(response);
  }

  Decision PluginClient::exchange(const Envelope& envelope) const
  {
    grpc::ClientContext context;
    prepare(context);
    pb::Envelope request;
    rpc::encode_envelope(envelope, &request);
    pb::Decision response;
    check(stub_->Exchange(&context, request, &response), "Exchange");

    Decision decision = rpc::decode_decision(response);
    validate_decision(decision, envelope.stage);
    return decision;
  }

  HealthStatus PluginClient::check_health() const
  {
    grpc::ClientContext context;
    prepare(context);
    google::protobuf::Empty request;
    pb::Health response;
    check(stub_->CheckHealth(&context, request, &response), "CheckHealth");
    return HealthStatus{response.state() == pb::Health::STATE_SERVING, response.active_calls()};
  }
}
