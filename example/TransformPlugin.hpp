//
// Stamps JSON request bodies with a _metadata object describing who processed them.
//

#ifndef TRANSFORMPLUGIN_HPP
#define TRANSFORMPLUGIN_HPP
#include "plugin/base_plugin.hpp"
#include "dto/TagInvoke.hpp"

#include <boost/beast/core/string.hpp>
#include <boost/json.hpp>
#include <fmt/core.h>

namespace transform
{
  using plugrt::framework::dto::tag_invoke;

  struct ProcessingMetadata
  {
    std::string processed_by;
    std::string version;
    std::string client_ip;
  };

  BOOST_DESCRIBE_STRUCT(ProcessingMetadata, (), (processed_by, version, client_ip))
}

class TransformPlugin : public plugrt::framework::BasePlugin<TransformPlugin>
{
public:
  static constexpr const char* name = "transform-plugin";
  static constexpr const char* version = "1.0.0";

  static std::shared_ptr<TransformPlugin> create() { return std::make_shared<TransformPlugin>(); }

  // Unexpected failures let the request through untouched.
  plugrt::framework::CapabilityDescriptor describe() const override
  {
    plugrt::framework::CapabilityDescriptor descriptor(name, version, "Transforms JSON request bodies");
    descriptor.support(plugrt::framework::Stage::Request, plugrt::framework::FailurePolicy::FailOpen);
    return descriptor;
  }

  void register_handlers(plugrt::framework::StageRouter& router) override
  {
    PLUGRT_STAGE(request, handle_request);
  }

private:
  static bool has_json_body(const plugrt::framework::Envelope& envelope)
  {
    const std::string method = envelope.method.value_or("");
    if (method != "POST" && method != "PUT" && method != "PATCH")
    {
      return false;
    }
    const std::string content_type =
      envelope.get_header(boost::beast::http::field::content_type).value_or("");
    return content_type.find("application/json") != std::string::npos && !envelope.body.empty();
  }

  plugrt::framework::Decision handle_request(const plugrt::framework::Envelope& envelope,
                                             plugrt::framework::CallContext& ctx) const
  {
    if (!has_json_body(envelope))
    {
      return plugrt::framework::Decision::pass();
    }

    boost::system::error_code ec;
    boost::json::value body = boost::json::parse(envelope.body, ec);
    if (ec)
    {
      fmt::print(stderr, "[transform-plugin] Invalid JSON body: {}\n", ec.message());
      plugrt::framework::HeaderMap headers;
      headers.set(boost::beast::http::field::content_type, "application/json");
      return plugrt::framework::Decision::short_circuit(
        400, boost::json::serialize(boost::json::object{{"error", "Invalid JSON"}}), std::move(headers));
    }

    if (!body.is_object())
    {
      return plugrt::framework::Decision::pass();
    }

    transform::ProcessingMetadata metadata{name, version, envelope.remote_addr.value_or("")};
    body.as_object()["_metadata"] = boost::json::value_from(metadata);

    plugrt::framework::Envelope mutated = envelope;
    mutated.body = boost::json::serialize(body);
    mutated.headers.set(boost::beast::http::field::content_length, std::to_string(mutated.body.size()));

    fmt::print("[transform-plugin] Transformed body of {} {} ({} bytes)\n", envelope.method.value_or(""),
               envelope.url.value_or(""), mutated.body.size());
    return plugrt::framework::Decision::mutate(std::move(mutated));
  }
};

#endif //TRANSFORMPLUGIN_HPP
