#ifndef PLUGRT_FRAMEWORK_CLIENT_PLUGIN_CLIENT_HPP
#define PLUGRT_FRAMEWORK_CLIENT_PLUGIN_CLIENT_HPP

#include "capability/capability_descriptor.hpp"
#include "exception/errors.hpp"
#include "exchange/decision.hpp"
#include "plugrt/v1/plugin.grpc.pb.h"

#include <grpcpp/channel.h>
#include <chrono>
#include <memory>
#include <string>

namespace plugrt::framework::client
{
  namespace pb = ::plugrt::v1;

  // A call that did not complete with OK.
  class RpcError : public PluginError
  {
  public:
    RpcError(grpc::StatusCode code, const std::string& message)
      : PluginError(message), code_(code)
    {
    }

    grpc::StatusCode code() const { return code_; }

  private:
    grpc::StatusCode code_;
  };

  struct HealthStatus
  {
    bool serving = false;
    std::uint32_t active_calls = 0;
  };

  /**
   * @brief Host-side view of a plugin process.
   *
   * Every call is synchronous and bounded by the configured timeout. Replies are decoded
   * and checked, so a Decision returned from exchange() is always protocol-valid.
   */
  class PluginClient
  {
  public:
    explicit PluginClient(std::shared_ptr<grpc::Channel> channel);
    // Insecure channel to "host:port" or "unix:/path".
    explicit PluginClient(const std::string& target);

    void set_timeout(std::chrono::milliseconds timeout);

    /**
     * @throws RpcError if the call fails, ProtocolError if the reply is invalid.
     */
    CapabilityDescriptor describe() const;

    /**
     * @throws RpcError if the call fails (INVALID_ARGUMENT for a rejected envelope),
     *         ProtocolError if the reply is invalid.
     */
    Decision exchange(const Envelope& envelope) const;

    HealthStatus check_health() const;

  private:
    void prepare(grpc::ClientContext& context) const;

    std::shared_ptr<grpc::Channel> channel_;
    std::unique_ptr<pb::Plugin::Stub> stub_;
    std::chrono::milliseconds timeout_{30000};
  };
}

#endif // PLUGRT_FRAMEWORK_CLIENT_PLUGIN_CLIENT_HPP
