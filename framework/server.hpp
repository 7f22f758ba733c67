// framework/server.hpp
#ifndef PLUGRT_FRAMEWORK_SERVER_HPP
#define PLUGRT_FRAMEWORK_SERVER_HPP

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <grpcpp/server.h>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <string_view>
#include <thread>

#include "config/runtime_config.hpp"
#include "dispatch/exchange_dispatcher.hpp"
#include "io_context_pool.hpp"
#include "rpc/plugin_service.hpp"

namespace plugrt::framework
{
  namespace net = boost::asio;

  // Per-call Dispatching/Completed is not a server state; see active_calls().
  enum class ServerState
  {
    Unstarted,
    Listening,
    ShuttingDown,
    Stopped
  };

  std::string_view to_string(ServerState state);

  enum ExitCode
  {
    ExitOk = 0,
    ExitConfigurationError = 1,
    ExitBindError = 2
  };

  /**
   * @brief Long-lived process hosting one plugin behind the gRPC Plugin service.
   *
   * Unstarted -> Listening -> ShuttingDown -> Stopped. Only construction
   * (ConfigurationError) and start() (BindError) can fail; per-call errors are
   * answered on the call and never change the state.
   */
  class RuntimeServer
  {
  public:
    // 构造时即向插件查询 descriptor 并校验，失败抛 ConfigurationError
    RuntimeServer(std::shared_ptr<Plugin> plugin, RuntimeConfig config);
    ~RuntimeServer();

    RuntimeServer(const RuntimeServer&) = delete;
    RuntimeServer& operator=(const RuntimeServer&) = delete;

    // Binds the endpoint and begins accepting calls. Throws BindError.
    void start();

    // Starts if needed, then blocks until SIGINT/SIGTERM or request_shutdown(), drains and stops.
    // Signals are handled on a dedicated thread, never on the handler pool.
    void run();

    // Thread-safe, may be called from a signal handler context or another thread.
    void request_shutdown();

    // Stops accepting calls, waits up to the drain timeout for in-flight calls and their
    // handlers, detaching any handler still running after it. Returns once the server is Stopped.
    void stop();

    ServerState state() const { return state_.load(); }
    int port() const { return selected_port_; }
    std::size_t active_calls() const { return service_.active_calls(); }
    const CapabilityDescriptor& descriptor() const { return dispatcher_.descriptor(); }
    const RuntimeConfig& config() const { return config_; }

  private:
    using Clock = std::chrono::steady_clock;

    void handle_signal(const boost::system::error_code& error, int signal_number);
    // Stops the handler pool, waiting for running handlers until deadline at most.
    void finish(Clock::time_point deadline);
    void join_signal_thread();

    RuntimeConfig config_;
    IoContextPool pool_;
    ExchangeDispatcher dispatcher_;
    rpc::PluginService service_;
    std::unique_ptr<grpc::Server> grpc_server_;
    net::io_context signal_ioc_;
    net::signal_set signals_;
    std::thread signal_thread_;
    std::atomic<ServerState> state_{ServerState::Unstarted};
    int selected_port_ = 0;

    std::mutex shutdown_mutex_;
    std::condition_variable shutdown_cv_;
    bool shutdown_requested_ = false;
  };

  using PluginFactory = std::function<std::shared_ptr<Plugin>(const RuntimeConfig&)>;

  /**
   * @brief Entry point for plugin executables.
   *
   * Loads the configuration from the environment and argv, builds the plugin, serves it
   * until a termination signal and returns the process exit code.
   */
  int serve(const PluginFactory& factory, int argc, char** argv);
}
#endif // PLUGRT_FRAMEWORK_SERVER_HPP
