// framework/dispatch/exchange_dispatcher.cpp
#include "exchange_dispatcher.hpp"
#include "dto/TagInvoke.hpp"
#include "exception/errors.hpp"

#include <boost/beast/http/field.hpp>
#include <fmt/core.h>
#include <algorithm>
#include <exception>
#include <future>

namespace plugrt::framework
{
  namespace
  {
    // How often a waiting call re-checks host cancellation.
    constexpr std::chrono::milliseconds cancel_poll_interval{5};

    // Shared between the waiting RPC thread and the pool thread running the handler, so an
    // abandoned handler still owns its envelope and context.
    struct PendingCall
    {
      PendingCall(Envelope env, const std::string& peer, CallContext::Clock::time_point deadline)
        : envelope(std::move(env)), context(peer, deadline)
      {
      }

      Envelope envelope;
      CallContext context;
      std::promise<Decision> promise;
    };
  }

  ExchangeDispatcher::ExchangeDispatcher(std::shared_ptr<Plugin> plugin, IoContextPool& pool,
                                         std::chrono::milliseconds call_timeout)
    : plugin_(std::move(plugin)),
      pool_(pool),
      call_timeout_(call_timeout)
  {
    if (!plugin_)
    {
      throw ConfigurationError("no plugin given to the runtime");
    }

    try
    {
      descriptor_ = plugin_->describe();
    }
    catch (const ConfigurationError&)
    {
      throw;
    }
    catch (const std::exception& e)
    {
      throw ConfigurationError(fmt::format("plugin failed to build its capability descriptor: {}", e.what()));
    }
    descriptor_.validate();

    try
    {
      plugin_->register_handlers(router_);
    }
    catch (const ConfigurationError&)
    {
      throw;
    }
    catch (const std::exception& e)
    {
      throw ConfigurationError(fmt::format("plugin '{}' failed to register handlers: {}", descriptor_.name(),
                                           e.what()));
    }

    for (const auto& support : descriptor_.stages())
    {
      if (!router_.has_handler(support.stage))
      {
        throw ConfigurationError(fmt::format("plugin '{}' declares stage {} but registers no handler for it",
                                             descriptor_.name(), to_string(support.stage)));
      }
    }
    for (const auto stage : router_.registered_stages())
    {
      if (!descriptor_.supports(stage))
      {
        fmt::print(stderr, "[Dispatcher] Warning: plugin '{}' has a {} handler but does not declare the stage, "
                   "it will never be called\n", descriptor_.name(), to_string(stage));
      }
    }

    for (const auto& support : descriptor_.stages())
    {
      fmt::print("[Dispatcher] Plugin '{}' {} handles {} ({})\n", descriptor_.name(), descriptor_.version(),
                 to_string(support.stage), to_string(support.failure_policy));
    }
  }

  Decision ExchangeDispatcher::exchange(const Envelope& envelope, const std::string& peer,
                                        Clock::time_point host_deadline, const CancelCheck& host_cancelled) const
  {
    validate_envelope(envelope);

    const auto policy = descriptor_.failure_policy(envelope.stage);
    if (!policy)
    {
      throw ProtocolError(fmt::format("plugin '{}' does not handle stage {}", descriptor_.name(),
                                      to_string(envelope.stage)));
    }
    const StageHandler* handler = router_.find(envelope.stage);

    const auto now = Clock::now();
    const auto deadline = host_deadline - now > call_timeout_ ? now + call_timeout_ : host_deadline;

    auto call = std::make_shared<PendingCall>(envelope, peer, deadline);
    auto future = call->promise.get_future();

    pool_.post([call, stage_handler = *handler]()
    {
      if (call->context.is_cancelled())
      {
        return;
      }
      try
      {
        call->promise.set_value(stage_handler(call->envelope, call->context));
      }
      catch (...)
      {
        call->promise.set_exception(std::current_exception());
      }
    });

    for (;;)
    {
      const auto left = deadline - Clock::now();
      if (left <= Clock::duration::zero())
      {
        call->context.cancel();
        fmt::print(stderr, "[Dispatcher] {} handler of '{}' exceeded its deadline ({} ms), peer {}\n",
                   to_string(envelope.stage), descriptor_.name(), call_timeout_.count(), peer);
        return on_failure(envelope, std::make_exception_ptr(TimeoutError("handler deadline exceeded")), *policy);
      }

      const auto slice = std::min<Clock::duration>(left, cancel_poll_interval);
      if (future.wait_for(slice) == std::future_status::ready)
      {
        break;
      }

      if (host_cancelled && host_cancelled())
      {
        call->context.cancel();
        fmt::print(stderr, "[Dispatcher] {} call from {} cancelled by host, result abandoned\n",
                   to_string(envelope.stage), peer);
        throw CallCancelled("call cancelled by host");
      }
    }

    try
    {
      Decision decision = future.get();
      validate_decision(decision, envelope.stage);
      return decision;
    }
    catch (...)
    {
      return on_failure(envelope, std::current_exception(), *policy);
    }
  }

  Decision ExchangeDispatcher::on_failure(const Envelope& envelope, std::exception_ptr eptr,
                                          FailurePolicy policy) const
  {
    const std::string reason = describe_exception(eptr);

    if (auto decision = map_exception(envelope, eptr, reason))
    {
      return std::move(*decision);
    }

    // 未被映射的异常统一包装为 HandlerError，插件可以用一个 HandlerError 映射兜底
    std::exception_ptr wrapped = wrap_handler_error(envelope, eptr, reason);
    if (wrapped != eptr)
    {
      if (auto decision = map_exception(envelope, wrapped, reason))
      {
        return std::move(*decision);
      }
    }

    return apply_policy(envelope, policy, reason);
  }

  std::optional<Decision> ExchangeDispatcher::map_exception(const Envelope& envelope, std::exception_ptr eptr,
                                                            const std::string& reason) const
  {
    try
    {
      if (auto decision = router_.handle_exception(eptr, envelope))
      {
        validate_decision(*decision, envelope.stage);
        fmt::print(stderr, "[Dispatcher] {} handler of '{}' failed ({}), mapped by plugin exception handler\n",
                   to_string(envelope.stage), descriptor_.name(), reason);
        return decision;
      }
    }
    catch (const std::exception& e)
    {
      fmt::print(stderr, "[Dispatcher] Exception handler of '{}' failed: {}\n", descriptor_.name(), e.what());
    }
    catch (...)
    {
      fmt::print(stderr, "[Dispatcher] Exception handler of '{}' threw a non-standard exception\n",
                 descriptor_.name());
    }
    return std::nullopt;
  }

  std::exception_ptr ExchangeDispatcher::wrap_handler_error(const Envelope& envelope, std::exception_ptr eptr,
                                                            const std::string& reason) const
  {
    try
    {
      std::rethrow_exception(eptr);
    }
    catch (const HandlerError&)
    {
      return eptr;
    }
    catch (...)
    {
      // the original stays reachable through std::rethrow_if_nested
      try
      {
        std::throw_with_nested(HandlerError(fmt::format("{} handler of '{}' failed: {}", to_string(envelope.stage),
                                                        descriptor_.name(), reason)));
      }
      catch (...)
      {
        return std::current_exception();
      }
    }
  }

  Decision ExchangeDispatcher::apply_policy(const Envelope& envelope, FailurePolicy policy,
                                            const std::string& reason) const
  {
    fmt::print(stderr, "[Dispatcher] {} handler of '{}' failed: {} -> {}\n", to_string(envelope.stage),
               descriptor_.name(), reason, to_string(policy));

    if (policy == FailurePolicy::FailOpen)
    {
      return Decision::pass();
    }

    dto::ErrorBody body{"plugin failed to process the message", descriptor_.name(),
                        std::string(to_string(envelope.stage))};
    HeaderMap headers;
    headers.set(boost::beast::http::field::content_type, "application/json");
    return Decision::short_circuit(500, dto::to_json(body), std::move(headers));
  }

  std::string ExchangeDispatcher::describe_exception(std::exception_ptr eptr)
  {
    try
    {
      std::rethrow_exception(eptr);
    }
    catch (const std::exception& e)
    {
      return e.what();
    }
    catch (...)
    {
      return "unknown exception";
    }
  }
}
