//
// Observes both stages and logs each message with credentials redacted. Never alters traffic.
//

#ifndef LOGGINGPLUGIN_HPP
#define LOGGINGPLUGIN_HPP
#include "plugin/base_plugin.hpp"

#include <boost/beast/core/string.hpp>
#include <boost/beast/http/status.hpp>
#include <fmt/core.h>
#include <mutex>

class LoggingPlugin : public plugrt::framework::BasePlugin<LoggingPlugin>
{
public:
  static std::shared_ptr<LoggingPlugin> create() { return std::make_shared<LoggingPlugin>(); }

  plugrt::framework::CapabilityDescriptor describe() const override
  {
    plugrt::framework::CapabilityDescriptor descriptor("logging-plugin", "1.0.0",
                                                       "Logs HTTP requests and responses");
    descriptor.support(plugrt::framework::Stage::Request, plugrt::framework::FailurePolicy::FailOpen)
              .support(plugrt::framework::Stage::Response, plugrt::framework::FailurePolicy::FailOpen);
    return descriptor;
  }

  void register_handlers(plugrt::framework::StageRouter& router) override
  {
    PLUGRT_STAGE(request, handle_request);
    PLUGRT_STAGE(response, handle_response);
  }

  std::size_t requests_seen() const
  {
    std::lock_guard<std::mutex> lock(mutex_);
    return requests_;
  }

  std::size_t responses_seen() const
  {
    std::lock_guard<std::mutex> lock(mutex_);
    return responses_;
  }

  // Header value as it appears in the log.
  static std::string loggable_value(boost::beast::string_view name, const std::string& value)
  {
    if (boost::beast::iequals(name, "Authorization") || boost::beast::iequals(name, "Cookie"))
    {
      return "[REDACTED]";
    }
    return value;
  }

private:
  mutable std::mutex mutex_;
  std::size_t requests_ = 0;
  std::size_t responses_ = 0;

  plugrt::framework::Decision handle_request(const plugrt::framework::Envelope& envelope,
                                             plugrt::framework::CallContext& ctx)
  {
    std::size_t seq;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      seq = ++requests_;
    }

    fmt::print("[logging-plugin] #{} {} {} from {}\n", seq, envelope.method.value_or(""),
               envelope.url.value_or(""), envelope.remote_addr.value_or(ctx.peer()));
    log_headers(envelope);
    if (!envelope.body.empty())
    {
      fmt::print("[logging-plugin]   body: {} bytes\n", envelope.body.size());
    }
    return plugrt::framework::Decision::pass();
  }

  plugrt::framework::Decision handle_response(const plugrt::framework::Envelope& envelope,
                                              plugrt::framework::CallContext& ctx)
  {
    std::size_t seq;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      seq = ++responses_;
    }

    const int code = envelope.status_code.value_or(0);
    fmt::print("[logging-plugin] #{} response {} {}\n", seq, code,
               std::string(boost::beast::http::obsolete_reason(boost::beast::http::int_to_status(code))));
    log_headers(envelope);
    return plugrt::framework::Decision::pass();
  }

  static void log_headers(const plugrt::framework::Envelope& envelope)
  {
    for (const auto& [name, values] : envelope.headers)
    {
      for (const auto& value : values)
      {
        fmt::print("[logging-plugin]   {}: {}\n", name, loggable_value(name, value));
      }
    }
  }
};

#endif //LOGGINGPLUGIN_HPP
