#ifndef PLUGRT_FRAMEWORK_EXCEPTION_ERRORS_HPP_
#define PLUGRT_FRAMEWORK_EXCEPTION_ERRORS_HPP_

#include <stdexcept>
#include <string>

namespace plugrt::framework
{
  class PluginError : public std::runtime_error
  {
  public:
    using std::runtime_error::runtime_error;
  };

  // Invalid setting, bad descriptor or a declared stage without a handler. Fatal at startup.
  class ConfigurationError : public PluginError
  {
  public:
    using PluginError::PluginError;
  };

  // Envelope or Decision that breaks the exchange contract.
  class ProtocolError : public PluginError
  {
  public:
    using PluginError::PluginError;
  };

  // Failure inside plugin handler code. Never reaches the host as-is.
  class HandlerError : public PluginError
  {
  public:
    using PluginError::PluginError;
  };

  class TimeoutError : public HandlerError
  {
  public:
    using HandlerError::HandlerError;
  };

  // Listen endpoint unavailable. Fatal at startup.
  class BindError : public PluginError
  {
  public:
    using PluginError::PluginError;
  };

  // The host cancelled or disconnected while the handler was running.
  class CallCancelled : public PluginError
  {
  public:
    using PluginError::PluginError;
  };
}

#endif // PLUGRT_FRAMEWORK_EXCEPTION_ERRORS_HPP_
