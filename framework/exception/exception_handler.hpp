#ifndef PLUGRT_FRAMEWORK_EXCEPTION_EXCEPTION_HANDLER_HPP_
#define PLUGRT_FRAMEWORK_EXCEPTION_EXCEPTION_HANDLER_HPP_

#include "exchange/decision.hpp"
#include <exception>
#include <functional>
#include <optional>
#include <vector>
#include <type_traits>

namespace plugrt::framework
{
  class ExceptionHandlerBase
  {
  public:
    virtual ~ExceptionHandlerBase() = default;

    /**
     * @brief Tries to turn a handler exception into a Decision.
     * @param eptr The exception thrown by the stage handler.
     * @param envelope The envelope the handler was working on.
     * @return A Decision if the exception was handled, std::nullopt otherwise.
     */
    virtual std::optional<Decision> try_handle(std::exception_ptr eptr, const Envelope& envelope)
    {
      return std::nullopt;
    }
  };

  /**
   * @brief Dispatches exceptions to handlers registered per exception type.
   * Handlers are tried in registration order; the first matching type wins.
   */
  class ExceptionDispatcher : public ExceptionHandlerBase
  {
  public:
    template <typename E>
    ExceptionDispatcher& on(std::function<Decision(const E&, const Envelope&)> handler)
    {
      handlers_.push_back([handler](std::exception_ptr eptr, const Envelope& envelope) -> std::optional<Decision>
      {
        try
        {
          std::rethrow_exception(eptr);
        }
        catch (typename std::conditional<std::is_pointer<E>::value || std::is_fundamental<E>::value, E, const E&>::type e)
        {
          return handler(e, envelope);
        }
        catch (...)
        {
          return std::nullopt;
        }
      });
      return *this;
    }

    std::optional<Decision> try_handle(std::exception_ptr eptr, const Envelope& envelope) override
    {
      for (const auto& handler : handlers_)
      {
        if (auto decision = handler(eptr, envelope))
        {
          return decision;
        }
      }
      return std::nullopt;
    }

  private:
    using Delegate = std::function<std::optional<Decision>(std::exception_ptr, const Envelope&)>;
    std::vector<Delegate> handlers_;
  };

  template <typename E>
  class ExceptionHandler : public ExceptionHandlerBase
  {
  public:
    std::optional<Decision> try_handle(std::exception_ptr eptr, const Envelope& envelope) override
    {
      try
      {
        std::rethrow_exception(eptr);
      }
      catch (const E& e)
      {
        return handle(e, envelope);
      }
      catch (...)
      {
        return std::nullopt;
      }
    }

    virtual Decision handle(const E& e, const Envelope& envelope) = 0;
  };
}

#endif // PLUGRT_FRAMEWORK_EXCEPTION_EXCEPTION_HANDLER_HPP_
