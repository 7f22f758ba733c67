//
// Rejects requests that do not carry the expected Bearer token.
//

#ifndef AUTHPLUGIN_HPP
#define AUTHPLUGIN_HPP
#include "plugin/base_plugin.hpp"
#include "config/runtime_config.hpp"

#include <boost/json.hpp>
#include <fmt/core.h>

class AuthPlugin : public plugrt::framework::BasePlugin<AuthPlugin>
{
public:
  explicit AuthPlugin(std::string expected_token) : expected_token_(std::move(expected_token))
  {
  }

  static std::shared_ptr<AuthPlugin> create(const plugrt::framework::RuntimeConfig& config)
  {
    return std::make_shared<AuthPlugin>(config.setting_or("AUTH_TOKEN", "secret-token-123"));
  }

  plugrt::framework::CapabilityDescriptor describe() const override
  {
    plugrt::framework::CapabilityDescriptor descriptor("auth-plugin", "1.0.0",
                                                       "Validates Bearer token authentication");
    descriptor.support(plugrt::framework::Stage::Request);
    return descriptor;
  }

  void register_handlers(plugrt::framework::StageRouter& router) override
  {
    PLUGRT_STAGE(request, handle_request);
  }

private:
  const std::string expected_token_;

  plugrt::framework::Decision handle_request(const plugrt::framework::Envelope& envelope,
                                             plugrt::framework::CallContext& ctx) const
  {
    fmt::print("[auth-plugin] Authenticating request: {} {}\n", envelope.method.value_or(""),
               envelope.url.value_or(""));

    const std::string header = envelope.get_header(boost::beast::http::field::authorization).value_or("");
    constexpr std::string_view prefix = "Bearer ";
    if (header.compare(0, prefix.size(), prefix) != 0)
    {
      fmt::print(stderr, "[auth-plugin] Missing or invalid Authorization header\n");
      return unauthorized("Missing or invalid Authorization header");
    }

    if (header.substr(prefix.size()) != expected_token_)
    {
      fmt::print(stderr, "[auth-plugin] Invalid token\n");
      return unauthorized("Invalid token");
    }

    fmt::print("[auth-plugin] Authentication successful\n");
    return plugrt::framework::Decision::pass();
  }

  static plugrt::framework::Decision unauthorized(const std::string& message)
  {
    plugrt::framework::HeaderMap headers;
    headers.set(boost::beast::http::field::content_type, "application/json");
    headers.set(boost::beast::http::field::www_authenticate, "Bearer");
    return plugrt::framework::Decision::short_circuit(
      401, boost::json::serialize(boost::json::object{{"error", message}}), std::move(headers));
  }
};

#endif //AUTHPLUGIN_HPP
