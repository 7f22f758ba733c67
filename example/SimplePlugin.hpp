//
// Minimal plugin: tags every request with an X-Simple-Plugin header.
//

#ifndef SIMPLEPLUGIN_HPP
#define SIMPLEPLUGIN_HPP
#include "plugin/base_plugin.hpp"

#include <fmt/core.h>

class SimplePlugin : public plugrt::framework::BasePlugin<SimplePlugin>
{
public:
  static std::shared_ptr<SimplePlugin> create() { return std::make_shared<SimplePlugin>(); }

  plugrt::framework::CapabilityDescriptor describe() const override
  {
    plugrt::framework::CapabilityDescriptor descriptor("simple-plugin", "1.0.0",
                                                       "Adds a custom header to HTTP requests");
    descriptor.support(plugrt::framework::Stage::Request);
    return descriptor;
  }

  void register_handlers(plugrt::framework::StageRouter& router) override
  {
    PLUGRT_STAGE(request, handle_request);
  }

private:
  plugrt::framework::Decision handle_request(const plugrt::framework::Envelope& envelope,
                                             plugrt::framework::CallContext& ctx) const
  {
    fmt::print("[simple-plugin] Processing request: {} {}\n", envelope.method.value_or(""),
               envelope.url.value_or(""));

    plugrt::framework::Envelope mutated = envelope;
    mutated.headers.set("X-Simple-Plugin", "processed");
    return plugrt::framework::Decision::mutate(std::move(mutated));
  }
};

#endif //SIMPLEPLUGIN_HPP
