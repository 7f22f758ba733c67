// framework/rpc/plugin_service.cpp
#include "plugin_service.hpp"
#include "wire_codec.hpp"
#include "exception/errors.hpp"

#include <fmt/core.h>
#include <chrono>

namespace plugrt::framework::rpc
{
  namespace
  {
    // RAII 计数当前正在处理的调用
    class ActiveCallGuard
    {
    public:
      explicit ActiveCallGuard(std::atomic<std::size_t>& counter) : counter_(counter) { ++counter_; }
      ~ActiveCallGuard() { --counter_; }

      ActiveCallGuard(const ActiveCallGuard&) = delete;
      ActiveCallGuard& operator=(const ActiveCallGuard&) = delete;

    private:
      std::atomic<std::size_t>& counter_;
    };

    // gRPC deadlines are wall-clock; the dispatcher works on steady_clock.
    CallContext::Clock::time_point to_steady_deadline(std::chrono::system_clock::time_point deadline)
    {
      const auto remaining = deadline - std::chrono::system_clock::now();
      if (remaining > std::chrono::hours(24 * 365))
      {
        return CallContext::Clock::time_point::max();
      }
      return CallContext::Clock::now() + std::chrono::duration_cast<CallContext::Clock::duration>(remaining);
    }
  }

  PluginService::PluginService(const ExchangeDispatcher& dispatcher, ServingProbe serving)
    : dispatcher_(dispatcher), serving_(std::move(serving))
  {
  }

  grpc::Status PluginService::Describe(grpc::ServerContext* context, const google::protobuf::Empty* request,
                                       pb::CapabilityDescriptor* response)
  {
    ActiveCallGuard guard(active_calls_);
    encode_descriptor(dispatcher_.descriptor(), response);
    return grpc::Status::OK;
  }

  grpc::Status PluginService::Exchange(grpc::ServerContext* context, const pb::Envelope* request,
                                       pb::Decision* response)
  {
    ActiveCallGuard guard(active_calls_);
    try
    {
      const Envelope envelope = decode_envelope(*request);
      const Decision decision = dispatcher_.exchange(envelope, context->peer(),
                                                     to_steady_deadline(context->deadline()),
                                                     [context]() { return context->IsCancelled(); });
      encode_decision(decision, response);
      return grpc::Status::OK;
    }
    catch (const ProtocolError& e)
    {
      fmt::print(stderr, "[PluginService] Rejected envelope from {}: {}\n", context->peer(), e.what());
      return {grpc::StatusCode::INVALID_ARGUMENT, e.what()};
    }
    catch (const CallCancelled& e)
    {
      return {grpc::StatusCode::CANCELLED, e.what()};
    }
  }

  grpc::Status PluginService::CheckHealth(grpc::ServerContext* context, const google::protobuf::Empty* request,
                                          pb::Health* response)
  {
    response->set_state(serving_ && serving_() ? pb::Health::STATE_SERVING : pb::Health::STATE_SHUTTING_DOWN);
    response->set_active_calls(static_cast<std::uint32_t>(active_calls_.load()));
    return grpc::Status::OK;
  }
}
