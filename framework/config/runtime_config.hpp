#ifndef PLUGRT_FRAMEWORK_CONFIG_RUNTIME_CONFIG_HPP
#define PLUGRT_FRAMEWORK_CONFIG_RUNTIME_CONFIG_HPP

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace plugrt::framework
{
  using Environment = std::map<std::string, std::string>;

  // Snapshot of the process environment.
  Environment capture_environment();

  enum class Network
  {
    Tcp,
    Unix
  };

  /**
   * @brief Everything the runtime reads from the outside world, loaded once at startup.
   *
   * Recognised environment variables:
   *   PLUGIN_PORT              TCP port when no --address is given (default 50051)
   *   PLUGIN_HOST              TCP host when no --address is given (default [::])
   *   PLUGIN_WORKERS           handler threads (default 10)
   *   PLUGIN_CALL_TIMEOUT_MS   per-call deadline (default 10000)
   *   PLUGIN_DRAIN_TIMEOUT_MS  shutdown drain window (default 5000)
   *
   * Command line (passed by a supervising host): --address <addr> [--network unix|tcp].
   * Once any argument is given --address is required and --network defaults to unix.
   *
   * The full environment is kept in `settings` for plugin specific values.
   */
  struct RuntimeConfig
  {
    static constexpr std::uint16_t default_port = 50051;

    Network network = Network::Tcp;
    std::string address = "[::]:50051";
    unsigned int worker_threads = 10;
    std::chrono::milliseconds call_timeout{10000};
    std::chrono::milliseconds drain_timeout{5000};
    Environment settings;

    /**
     * @throws ConfigurationError on a malformed value or unknown argument.
     */
    static RuntimeConfig load(const Environment& env, const std::vector<std::string>& args = {});

    // load(capture_environment(), argv[1..])
    static RuntimeConfig from_process(int argc, char** argv);

    // Address in the form gRPC expects, e.g. "[::]:50051" or "unix:/run/plugin.sock".
    std::string listen_uri() const;

    std::optional<std::string> setting(const std::string& key) const;
    std::string setting_or(const std::string& key, std::string fallback) const;

    /**
     * @throws ConfigurationError if the setting is absent or empty.
     */
    std::string require_setting(const std::string& key) const;
  };
}

#endif // PLUGRT_FRAMEWORK_CONFIG_RUNTIME_CONFIG_HPP
