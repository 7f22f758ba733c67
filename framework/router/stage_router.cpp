// framework/router/stage_router.cpp
#include "stage_router.hpp"
#include <fmt/core.h>

namespace plugrt::framework
{
  void StageRouter::request(StageHandler handler)
  {
    on(Stage::Request, std::move(handler));
  }

  void StageRouter::response(StageHandler handler)
  {
    on(Stage::Response, std::move(handler));
  }

  void StageRouter::on(Stage stage, StageHandler handler)
  {
    if (handlers_.count(stage))
    {
      fmt::print("Updated handler for stage: {}\n", to_string(stage));
    }
    handlers_[stage] = std::move(handler);
  }

  bool StageRouter::has_handler(Stage stage) const
  {
    return find(stage) != nullptr;
  }

  std::vector<Stage> StageRouter::registered_stages() const
  {
    std::vector<Stage> stages;
    stages.reserve(handlers_.size());
    for (const auto& [stage, handler] : handlers_)
    {
      stages.push_back(stage);
    }
    return stages;
  }

  const StageHandler* StageRouter::find(Stage stage) const
  {
    if (const auto it = handlers_.find(stage); it != handlers_.end() && it->second)
    {
      return &it->second;
    }
    return nullptr;
  }

  void StageRouter::add_exception_handler(std::shared_ptr<ExceptionHandlerBase> handler)
  {
    exception_handlers_.push_back(std::move(handler));
  }

  std::optional<Decision> StageRouter::handle_exception(std::exception_ptr eptr, const Envelope& envelope) const
  {
    for (const auto& handler : exception_handlers_)
    {
      if (auto decision = handler->try_handle(eptr, envelope))
      {
        return decision;
      }
    }
    return std::nullopt;
  }
}
