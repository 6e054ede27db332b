// Copyright (c) 2024 LLM Monitor
// Distributed under the MIT software license

#include "app/app_config.hpp"
#include "util/netaddress.hpp"
#include <sstream>

namespace llmmonitor {
namespace app {

namespace {

using discovery::ConfigError;

size_t ParseCount(const std::string &flag, const std::string &value) {
  auto parsed = util::SafeParseInt(value);
  if (!parsed || *parsed < 1) {
    throw ConfigError(flag + " must be a positive integer, got '" + value + "'");
  }
  return static_cast<size_t>(*parsed);
}

bool TakeValue(const std::string &arg, const std::string &prefix,
               std::string &out) {
  if (arg.rfind(prefix, 0) != 0) {
    return false;
  }
  out = arg.substr(prefix.size());
  return true;
}

} // namespace

std::string UsageText(const std::string &program_name) {
  std::ostringstream out;
  out << "Usage: " << program_name << " [options]\n"
      << "\n"
      << "Discovery (override the DISCOVERY_* environment variables):\n"
      << "  --cidr=<list>        CIDR ranges to scan, comma separated (required)\n"
      << "                       e.g. --cidr=192.168.1.0/24,10.0.0.0/16\n"
      << "  --interval=<secs>    Seconds between scan passes (default: 60)\n"
      << "  --parallel=<n>       Maximum probes in flight (default: 10)\n"
      << "  --timeout=<secs>     Per-probe timeout, fractional allowed (default: 2.0)\n"
      << "  --port=<port>        Port to probe (default: 11434)\n"
      << "  --hosts=<list>       Predefined hosts ip:port, comma separated\n"
      << "                       (overrides OLLAMA_HOSTS)\n"
      << "  --once               Run a single pass, print JSON and exit\n"
      << "\n"
      << "Polling:\n"
      << "  --window=<secs>      Activity window length (default: 5)\n"
      << "  --threshold=<n>      Ticks per window that trigger a refresh (default: 4)\n"
      << "  --maxcycles=<n>      Idle windows before a forced refresh (default: 12)\n"
      << "  --statusinterval=<secs>  Seconds between status log lines (default: 60)\n"
      << "\n"
      << "Logging:\n"
      << "  --loglevel=<level>   Set global log level (trace,debug,info,warn,error,critical)\n"
      << "                       Default: info\n"
      << "  --debug=<component>  Enable trace logging for specific component(s)\n"
      << "                       Components: discovery, poll, app, all\n"
      << "                       Can be comma-separated: --debug=discovery,poll\n"
      << "  --logfile=<path>     Log to file instead of the console\n"
      << "\n"
      << "Other:\n"
      << "  --version            Show version information\n"
      << "  --help               Show this help message\n";
  return out.str();
}

CommandLine ParseCommandLine(int argc, const char *const argv[]) {
  CommandLine result;
  AppConfig &config = result.config;
  auto &overrides = result.env_overrides;

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    std::string value;

    if (arg == "--help") {
      result.show_help = true;
      return result;
    } else if (arg == "--version") {
      result.show_version = true;
      return result;
    } else if (TakeValue(arg, "--cidr=", value)) {
      overrides["DISCOVERY_CIDR_RANGES"] = value;
    } else if (TakeValue(arg, "--interval=", value)) {
      overrides["DISCOVERY_INTERVAL_SECONDS"] = value;
    } else if (TakeValue(arg, "--parallel=", value)) {
      overrides["DISCOVERY_MAX_PARALLEL"] = value;
    } else if (TakeValue(arg, "--timeout=", value)) {
      overrides["DISCOVERY_TIMEOUT_SECONDS"] = value;
    } else if (TakeValue(arg, "--port=", value)) {
      overrides["DISCOVERY_PORT"] = value;
    } else if (TakeValue(arg, "--hosts=", value)) {
      overrides["OLLAMA_HOSTS"] = value;
    } else if (arg == "--once") {
      config.run_once = true;
    } else if (TakeValue(arg, "--window=", value)) {
      config.poll.window =
          std::chrono::seconds(ParseCount("--window", value));
    } else if (TakeValue(arg, "--threshold=", value)) {
      config.poll.tick_threshold = ParseCount("--threshold", value);
    } else if (TakeValue(arg, "--maxcycles=", value)) {
      config.poll.max_cycles = ParseCount("--maxcycles", value);
    } else if (TakeValue(arg, "--statusinterval=", value)) {
      config.status_interval =
          std::chrono::seconds(ParseCount("--statusinterval", value));
    } else if (TakeValue(arg, "--loglevel=", value)) {
      config.log_level = value;
    } else if (TakeValue(arg, "--debug=", value)) {
      auto components = util::SplitAndTrim(value, ',');
      config.debug_components.insert(config.debug_components.end(),
                                     components.begin(), components.end());
    } else if (TakeValue(arg, "--logfile=", value)) {
      if (value.empty()) {
        throw ConfigError("--logfile needs a path");
      }
      config.log_file = value;
    } else {
      throw ConfigError("Unknown option: " + arg);
    }
  }
  return result;
}

void LoadEnvironment(CommandLine &cli, const discovery::EnvLookup &env) {
  const auto &overrides = cli.env_overrides;
  discovery::EnvLookup layered =
      [&overrides, &env](const std::string &name) -> std::optional<std::string> {
    auto it = overrides.find(name);
    if (it != overrides.end()) {
      return it->second;
    }
    return env(name);
  };

  cli.config.discovery = discovery::LoadDiscoveryConfig(layered);
  cli.config.static_hosts = discovery::LoadStaticHosts(layered);
}

} // namespace app
} // namespace llmmonitor
