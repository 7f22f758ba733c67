// framework/dispatch/exchange_dispatcher.hpp
#ifndef PLUGRT_FRAMEWORK_DISPATCH_EXCHANGE_DISPATCHER_HPP
#define PLUGRT_FRAMEWORK_DISPATCH_EXCHANGE_DISPATCHER_HPP

#include "capability/capability_descriptor.hpp"
#include "context/call_context.hpp"
#include "exchange/decision.hpp"
#include "io_context_pool.hpp"
#include "plugin/base_plugin.hpp"
#include "router/stage_router.hpp"
#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace plugrt::framework
{
  /**
   * @brief Runs one exchange against the plugin and always produces a protocol-valid answer.
   *
   * The handler executes on the IoContextPool while the calling thread waits for it,
   * watching the deadline and the host's cancellation. Handler failures and timeouts are
   * first offered to the plugin's exception handlers, once as thrown and once wrapped in a
   * HandlerError (with the original nested), and otherwise turned into a Decision
   * according to the stage's FailurePolicy.
   */
  class ExchangeDispatcher
  {
  public:
    using Clock = CallContext::Clock;
    using CancelCheck = std::function<bool()>;

    /**
     * @brief Queries and validates the plugin's descriptor and installs its handlers.
     * @throws ConfigurationError if describe() throws, the descriptor is invalid, or a
     *         declared stage has no handler.
     */
    ExchangeDispatcher(std::shared_ptr<Plugin> plugin, IoContextPool& pool, std::chrono::milliseconds call_timeout);

    const CapabilityDescriptor& descriptor() const { return descriptor_; }
    std::chrono::milliseconds call_timeout() const { return call_timeout_; }

    /**
     * @brief Dispatches one envelope to the handler of its stage.
     * @param envelope The intercepted message, validated before the handler sees it.
     * @param peer Identifier of the caller, for logging.
     * @param host_deadline Deadline set by the host; the earlier of it and the call timeout applies.
     * @param host_cancelled Polled while waiting; returns true once the host gave up on the call.
     * @throws ProtocolError for a malformed envelope or an undeclared stage.
     * @throws CallCancelled if host_cancelled reported true before the handler finished.
     */
    Decision exchange(const Envelope& envelope,
                      const std::string& peer = {},
                      Clock::time_point host_deadline = Clock::time_point::max(),
                      const CancelCheck& host_cancelled = nullptr) const;

  private:
    Decision on_failure(const Envelope& envelope, std::exception_ptr eptr, FailurePolicy policy) const;
    std::optional<Decision> map_exception(const Envelope& envelope, std::exception_ptr eptr,
                                          const std::string& reason) const;
    std::exception_ptr wrap_handler_error(const Envelope& envelope, std::exception_ptr eptr,
                                          const std::string& reason) const;
    Decision apply_policy(const Envelope& envelope, FailurePolicy policy, const std::string& reason) const;

    static std::string describe_exception(std::exception_ptr eptr);

    std::shared_ptr<Plugin> plugin_;
    IoContextPool& pool_;
    const std::chrono::milliseconds call_timeout_;
    CapabilityDescriptor descriptor_;
    StageRouter router_;
  };
}

#endif // PLUGRT_FRAMEWORK_DISPATCH_EXCHANGE_DISPATCHER_HPP
