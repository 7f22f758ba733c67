#include "runtime_config.hpp"
#include "exception/errors.hpp"

#include <fmt/core.h>
#include <limits>

extern char** environ;

namespace plugrt::framework
{
  namespace
  {
    unsigned long parse_number(const std::string& name, const std::string& text, unsigned long min,
                               unsigned long max)
    {
      std::size_t consumed = 0;
      unsigned long value = 0;
      try
      {
        value = std::stoul(text, &consumed);
      }
      catch (const std::exception&)
      {
        throw ConfigurationError(fmt::format("{} must be a number, got '{}'", name, text));
      }
      if (consumed != text.size() || text.front() == '-' || value < min || value > max)
      {
        throw ConfigurationError(fmt::format("{} must be between {} and {}, got '{}'", name, min, max, text));
      }
      return value;
    }

    std::optional<std::string> lookup(const Environment& env, const std::string& key)
    {
      if (auto it = env.find(key); it != env.end() && !it->second.empty())
      {
        return it->second;
      }
      return std::nullopt;
    }
  }

  Environment capture_environment()
  {
    Environment env;
    for (char** entry = environ; entry != nullptr && *entry != nullptr; ++entry)
    {
      std::string line(*entry);
      if (auto eq = line.find('='); eq != std::string::npos)
      {
        env.emplace(line.substr(0, eq), line.substr(eq + 1));
      }
    }
    return env;
  }

  RuntimeConfig RuntimeConfig::load(const Environment& env, const std::vector<std::string>& args)
  {
    RuntimeConfig config;
    config.settings = env;

    const std::string host = lookup(env, "PLUGIN_HOST").value_or("[::]");
    std::uint16_t port = default_port;
    if (auto value = lookup(env, "PLUGIN_PORT"))
    {
      port = static_cast<std::uint16_t>(parse_number("PLUGIN_PORT", *value, 0, 65535));
    }
    config.address = fmt::format("{}:{}", host, port);

    if (auto value = lookup(env, "PLUGIN_WORKERS"))
    {
      config.worker_threads = static_cast<unsigned int>(parse_number("PLUGIN_WORKERS", *value, 1, 1024));
    }
    if (auto value = lookup(env, "PLUGIN_CALL_TIMEOUT_MS"))
    {
      config.call_timeout = std::chrono::milliseconds(
        parse_number("PLUGIN_CALL_TIMEOUT_MS", *value, 1, std::numeric_limits<unsigned int>::max()));
    }
    if (auto value = lookup(env, "PLUGIN_DRAIN_TIMEOUT_MS"))
    {
      config.drain_timeout = std::chrono::milliseconds(
        parse_number("PLUGIN_DRAIN_TIMEOUT_MS", *value, 0, std::numeric_limits<unsigned int>::max()));
    }

    if (args.empty())
    {
      return config;
    }

    // 由宿主进程启动：必须给出 --address
    std::optional<std::string> address;
    std::string network = "unix";
    for (std::size_t i = 0; i < args.size(); ++i)
    {
      const std::string& arg = args[i];
      auto take_value = [&](const std::string& flag) -> std::string
      {
        if (arg.size() > flag.size() && arg.compare(0, flag.size() + 1, flag + "=") == 0)
        {
          return arg.substr(flag.size() + 1);
        }
        if (arg == flag && i + 1 < args.size())
        {
          return args[++i];
        }
        throw ConfigurationError(fmt::format("{} needs a value", flag));
      };

      if (arg.rfind("--address", 0) == 0)
      {
        address = take_value("--address");
      }
      else if (arg.rfind("--network", 0) == 0)
      {
        network = take_value("--network");
      }
      else
      {
        throw ConfigurationError(fmt::format("unknown argument '{}'", arg));
      }
    }

    if (!address || address->empty())
    {
      throw ConfigurationError("--address is required when running with command-line arguments; "
        "run without arguments for standalone mode");
    }

    if (network == "unix")
    {
      config.network = Network::Unix;
      config.address = *address;
    }
    else if (network == "tcp")
    {
      config.network = Network::Tcp;
      if (address->find(':') == std::string::npos)
      {
        // bare port
        parse_number("--address", *address, 0, 65535);
        config.address = fmt::format("[::]:{}", *address);
      }
      else
      {
        config.address = *address;
      }
    }
    else
    {
      throw ConfigurationError(fmt::format("--network must be 'unix' or 'tcp', got '{}'", network));
    }
    return config;
  }

  RuntimeConfig RuntimeConfig::from_process(int argc, char** argv)
  {
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i)
    {
      args.emplace_back(argv[i]);
    }
    return load(capture_environment(), args);
  }

  std::string RuntimeConfig::listen_uri() const
  {
    if (network == Network::Unix)
    {
      return "unix:" + address;
    }
    return address;
  }

  std::optional<std::string> RuntimeConfig::setting(const std::string& key) const
  {
    if (auto it = settings.find(key); it != settings.end())
    {
      return it->second;
    }
    return std::nullopt;
  }

  std::string RuntimeConfig::setting_or(const std::string& key, std::string fallback) const
  {
    auto value = setting(key);
    return value ? *value : std::move(fallback);
  }

  std::string RuntimeConfig::require_setting(const std::string& key) const
  {
    auto value = setting(key);
    if (!value || value->empty())
    {
      throw ConfigurationError(fmt::format("required setting {} is not set", key));
    }
    return *value;
  }
}
