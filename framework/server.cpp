// framework/server.cpp
#include "server.hpp"
#include "exception/errors.hpp"

#include <grpc/grpc.h>
#include <grpcpp/security/server_credentials.h>
#include <grpcpp/server_builder.h>
#include <fmt/core.h>
#include <csignal>
#include <utility>

namespace plugrt::framework
{
  std::string_view to_string(ServerState state)
  {
    switch (state)
    {
    case ServerState::Unstarted:
      return "Unstarted";
    case ServerState::Listening:
      return "Listening";
    case ServerState::ShuttingDown:
      return "ShuttingDown";
    case ServerState::Stopped:
      return "Stopped";
    }
    return "Unknown";
  }

  RuntimeServer::RuntimeServer(std::shared_ptr<Plugin> plugin, RuntimeConfig config)
    : config_(std::move(config)),
      pool_(config_.worker_threads),
      dispatcher_(std::move(plugin), pool_, config_.call_timeout),
      service_(dispatcher_, [this]() { return state_.load() == ServerState::Listening; }),
      signals_(signal_ioc_)
  {
    // 信号在独立的 io_context 上处理，处理器线程全部阻塞时也能响应 SIGTERM
    boost::system::error_code ec;
    signals_.add(SIGINT, ec);
    if (!ec)
    {
      signals_.add(SIGTERM, ec);
    }
    if (ec)
    {
      fmt::print(stderr, "[RuntimeServer] Cannot install signal handlers: {}\n", ec.message());
    }
  }

  RuntimeServer::~RuntimeServer()
  {
    stop();
    finish(Clock::now());
    join_signal_thread();
  }

  void RuntimeServer::start()
  {
    ServerState expected = ServerState::Unstarted;
    if (!state_.compare_exchange_strong(expected, ServerState::Listening))
    {
      fmt::print(stderr, "[RuntimeServer] start() ignored in state {}\n", to_string(expected));
      return;
    }

    const std::string uri = config_.listen_uri();

    grpc::ServerBuilder builder;
    // 端口被占用时必须失败，而不是和另一个进程共享
    builder.AddChannelArgument(GRPC_ARG_ALLOW_REUSEPORT, 0);
    builder.AddListeningPort(uri, grpc::InsecureServerCredentials(), &selected_port_);
    builder.RegisterService(&service_);
    grpc_server_ = builder.BuildAndStart();

    if (!grpc_server_ || (config_.network == Network::Tcp && selected_port_ == 0))
    {
      if (grpc_server_)
      {
        grpc_server_->Shutdown();
        grpc_server_.reset();
      }
      finish(Clock::now());
      fmt::print(stderr, "[RuntimeServer] Failed to bind {}\n", uri);
      throw BindError(fmt::format("failed to bind {}", uri));
    }

    if (config_.network == Network::Tcp)
    {
      fmt::print("[RuntimeServer] Plugin '{}' listening on {} (port {})\n", descriptor().name(), uri,
                 selected_port_);
    }
    else
    {
      fmt::print("[RuntimeServer] Plugin '{}' listening on {}\n", descriptor().name(), uri);
    }
  }

  void RuntimeServer::run()
  {
    if (state_.load() == ServerState::Unstarted)
    {
      start();
    }
    if (state_.load() != ServerState::Listening)
    {
      return;
    }

    signals_.async_wait([this](const boost::system::error_code& error, int signal_number)
    {
      handle_signal(error, signal_number);
    });
    signal_thread_ = std::thread([this]()
    {
      signal_ioc_.run();
    });

    {
      std::unique_lock<std::mutex> lock(shutdown_mutex_);
      shutdown_cv_.wait(lock, [this]() { return shutdown_requested_; });
    }

    stop();
    // stop() may already have run on another thread
    join_signal_thread();
  }

  void RuntimeServer::request_shutdown()
  {
    {
      std::lock_guard<std::mutex> lock(shutdown_mutex_);
      shutdown_requested_ = true;
    }
    shutdown_cv_.notify_all();
  }

  void RuntimeServer::stop()
  {
    ServerState expected = ServerState::Listening;
    if (!state_.compare_exchange_strong(expected, ServerState::ShuttingDown))
    {
      return;
    }

    fmt::print("[RuntimeServer] Shutting down (drain timeout {} ms, {} call(s) in flight)...\n",
               config_.drain_timeout.count(), active_calls());

    boost::system::error_code ec;
    signals_.cancel(ec);
    join_signal_thread();

    // Blocks until in-flight calls finish or the drain deadline cancels them.
    const auto drain_deadline = Clock::now() + config_.drain_timeout;
    grpc_server_->Shutdown(std::chrono::system_clock::now() + config_.drain_timeout);
    grpc_server_->Wait();
    finish(drain_deadline);
    fmt::print("[RuntimeServer] Server stopped gracefully.\n");

    // run() may still be waiting if stop() came from elsewhere
    request_shutdown();
  }

  void RuntimeServer::finish(Clock::time_point deadline)
  {
    if (state_.load() == ServerState::Stopped)
    {
      return;
    }
    // handlers abandoned after a timeout may still be running; they get the rest of the drain window
    if (!pool_.stop(deadline))
    {
      fmt::print(stderr, "[RuntimeServer] {} handler(s) still running after the drain timeout, detached\n",
                 pool_.running());
    }
    state_.store(ServerState::Stopped);
  }

  void RuntimeServer::join_signal_thread()
  {
    signal_ioc_.stop();
    if (signal_thread_.joinable() && signal_thread_.get_id() != std::this_thread::get_id())
    {
      signal_thread_.join();
    }
  }

  void RuntimeServer::handle_signal(const boost::system::error_code& error, int signal_number)
  {
    if (!error)
    {
      fmt::print("[RuntimeServer] Received signal {}, shutting down gracefully...\n", signal_number);
      request_shutdown();
    }
  }

  int serve(const PluginFactory& factory, int argc, char** argv)
  {
    std::unique_ptr<RuntimeServer> server;
    try
    {
      RuntimeConfig config = RuntimeConfig::from_process(argc, argv);
      std::shared_ptr<Plugin> plugin = factory(config);
      server = std::make_unique<RuntimeServer>(std::move(plugin), std::move(config));
    }
    catch (const std::exception& e)
    {
      fmt::print(stderr, "[RuntimeServer] Configuration error: {}\n", e.what());
      return ExitConfigurationError;
    }

    try
    {
      server->start();
    }
    catch (const BindError& e)
    {
      fmt::print(stderr, "[RuntimeServer] {}\n", e.what());
      return ExitBindError;
    }

    server->run();
    return ExitOk;
  }
}
