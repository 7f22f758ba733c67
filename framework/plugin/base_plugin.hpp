// framework/plugin/base_plugin.hpp
#ifndef PLUGRT_FRAMEWORK_PLUGIN_BASE_PLUGIN_HPP
#define PLUGRT_FRAMEWORK_PLUGIN_BASE_PLUGIN_HPP

#include "capability/capability_descriptor.hpp"
#include "router/stage_router.hpp"
#include <functional>
#include <memory>
#include <type_traits>

namespace plugrt::framework
{
#ifndef PLUGRT_STAGE
#define PLUGRT_STAGE(STAGE, METHOD_NAME) \
router.STAGE(bind_handler(&std::decay_t<decltype(*this)>::METHOD_NAME))
#endif

  /**
   * @brief What the runtime needs from a plugin.
   *
   * describe() is called exactly once, before the server listens. register_handlers()
   * must install a handler for every stage the descriptor declares.
   */
  class Plugin
  {
  public:
    virtual ~Plugin() = default;

    virtual CapabilityDescriptor describe() const = 0;

    virtual void register_handlers(StageRouter& router) = 0;
  };

  template <typename Derived>
  class BasePlugin : public Plugin, public std::enable_shared_from_this<Derived>
  {
  public:
    ~BasePlugin() override = default;

  protected:
    template <typename MethodPtr>
    inline auto bind_handler(MethodPtr method_ptr)
    {
      return std::bind(method_ptr, this->shared_from_this(), std::placeholders::_1, std::placeholders::_2);
    }
  };
} // namespace plugrt::framework

#endif // PLUGRT_FRAMEWORK_PLUGIN_BASE_PLUGIN_HPP
