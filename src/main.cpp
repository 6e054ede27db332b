// Copyright (c) 2024 LLM Monitor
// Distributed under the MIT software license

#include "app/app_config.hpp"
#include "application.hpp"
#include "util/logging.hpp"
#include "version.hpp"
#include <iostream> // Keep for CLI output and early errors before logger initialized
#include <nlohmann/json.hpp>

int main(int argc, char *argv[]) {
  try {
    // Parse command line arguments
    auto cli = llmmonitor::app::ParseCommandLine(argc, argv);

    if (cli.show_help) {
      std::cout << llmmonitor::app::UsageText(argv[0]) << std::endl;
      return 0;
    }
    if (cli.show_version) {
      std::cout << llmmonitor::GetFullVersionString() << std::endl;
      std::cout << llmmonitor::GetCopyrightString() << std::endl;
      return 0;
    }

    auto &config = cli.config;

    // A one-shot run prints JSON on stdout; keep the console quiet by default
    std::string log_level = config.log_level;
    if (config.run_once && log_level == "info" && config.log_file.empty()) {
      log_level = "warn";
    }
    llmmonitor::util::LogManager::Initialize(log_level, !config.log_file.empty(),
                                             config.log_file);

    // Apply component-specific debug levels
    for (const auto &component : config.debug_components) {
      if (component == "all") {
        llmmonitor::util::LogManager::SetLogLevel("trace");
      } else {
        llmmonitor::util::LogManager::SetComponentLevel(component, "trace");
      }
    }

    llmmonitor::app::LoadEnvironment(
        cli, llmmonitor::discovery::ProcessEnvironment());

    // Create and initialize application
    llmmonitor::app::Application app(config);

    if (!app.initialize()) {
      LOG_ERROR("Failed to initialize application");
      llmmonitor::util::LogManager::Shutdown();
      return 1;
    }

    if (config.run_once) {
      std::cout << app.run_once().dump(2) << std::endl;
      llmmonitor::util::LogManager::Shutdown();
      return 0;
    }

    if (!app.start()) {
      LOG_ERROR("Failed to start application");
      llmmonitor::util::LogManager::Shutdown();
      return 1;
    }

    // Run until shutdown requested
    app.wait_for_shutdown();

    llmmonitor::util::LogManager::Shutdown();
    return 0;

  } catch (const llmmonitor::discovery::ConfigError &e) {
    std::cerr << "Configuration error: " << e.what() << std::endl;
    std::cerr << "Run with --help for usage" << std::endl;
    llmmonitor::util::LogManager::Shutdown();
    return 1;
  } catch (const std::exception &e) {
    // Use std::cerr here because logger may not be safe during exception
    // handling
    std::cerr << "Fatal exception: " << e.what() << std::endl;
    llmmonitor::util::LogManager::Shutdown();
    return 1;
  }
}
