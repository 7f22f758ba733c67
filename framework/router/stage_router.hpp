// framework/router/stage_router.hpp
#ifndef PLUGRT_FRAMEWORK_ROUTER_STAGE_ROUTER_HPP
#define PLUGRT_FRAMEWORK_ROUTER_STAGE_ROUTER_HPP

#include "context/call_context.hpp"
#include "exception/exception_handler.hpp"
#include "exchange/decision.hpp"
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <vector>

namespace plugrt::framework
{
  using StageHandler = std::function<Decision(const Envelope&, CallContext&)>;

  // 每个 Stage 一个处理函数，外加插件自定义的异常映射
  class StageRouter
  {
  public:
    StageRouter() = default;

    void request(StageHandler handler);
    void response(StageHandler handler);
    void on(Stage stage, StageHandler handler);

    bool has_handler(Stage stage) const;
    std::vector<Stage> registered_stages() const;

    // nullptr when nothing is registered for the stage
    const StageHandler* find(Stage stage) const;

    // Exception handling
    void add_exception_handler(std::shared_ptr<ExceptionHandlerBase> handler);
    std::optional<Decision> handle_exception(std::exception_ptr eptr, const Envelope& envelope) const;

  private:
    std::map<Stage, StageHandler> handlers_;
    std::vector<std::shared_ptr<ExceptionHandlerBase>> exception_handlers_;
  };
}
#endif // PLUGRT_FRAMEWORK_ROUTER_STAGE_ROUTER_HPP
