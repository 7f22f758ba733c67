// framework/rpc/plugin_service.hpp
#ifndef PLUGRT_FRAMEWORK_RPC_PLUGIN_SERVICE_HPP
#define PLUGRT_FRAMEWORK_RPC_PLUGIN_SERVICE_HPP

#include "dispatch/exchange_dispatcher.hpp"
#include "plugrt/v1/plugin.grpc.pb.h"
#include <atomic>
#include <functional>

namespace plugrt::framework::rpc
{
  namespace pb = ::plugrt::v1;

  // gRPC adapter over the dispatcher. Each RPC runs on its own gRPC server thread.
  class PluginService final : public pb::Plugin::Service
  {
  public:
    using ServingProbe = std::function<bool()>;

    PluginService(const ExchangeDispatcher& dispatcher, ServingProbe serving);

    grpc::Status Describe(grpc::ServerContext* context, const google::protobuf::Empty* request,
                          pb::CapabilityDescriptor* response) override;

    grpc::Status Exchange(grpc::ServerContext* context, const pb::Envelope* request,
                          pb::Decision* response) override;

    grpc::Status CheckHealth(grpc::ServerContext* context, const google::protobuf::Empty* request,
                             pb::Health* response) override;

    std::size_t active_calls() const { return active_calls_.load(); }

  private:
    const ExchangeDispatcher& dispatcher_;
    ServingProbe serving_;
    std::atomic<std::size_t> active_calls_{0};
  };
}

#endif // PLUGRT_FRAMEWORK_RPC_PLUGIN_SERVICE_HPP
