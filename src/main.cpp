#include "core/config.hpp"
#include "core/logger.hpp"
#include "dictionary/dictionary_loader.hpp"
#include "dictionary/dictionary_store.hpp"
#include "io/web/web_server.hpp"
#include "service/text_service.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <unistd.h>

// Global atomic flags for signal handling
std::atomic<bool> g_shutdown_requested = false;
std::atomic<bool> g_reload_requested = false;

// A simple, safe signal handler function
void signal_handler(int signum) {
  if (signum == SIGINT || signum == SIGTERM)
    g_shutdown_requested = true;
  else if (signum == SIGHUP)
    g_reload_requested = true;
}

int main(int argc, char *argv[]) {
  std::ios_base::sync_with_stdio(false);

  // Register all signal handlers
  struct sigaction action;
  action.sa_handler = signal_handler;
  sigemptyset(&action.sa_mask);
  action.sa_flags = 0;

  sigaction(SIGINT, &action, NULL);
  sigaction(SIGTERM, &action, NULL);
  sigaction(SIGHUP, &action, NULL);

  // --- Load Configuration ---
  Config::ConfigManager config_manager;
  std::string config_file_to_load = "config.ini";
  if (argc > 1)
    config_file_to_load = argv[1];
  config_manager.load_configuration(config_file_to_load);

  auto current_config = config_manager.get_config();

  // --- Initialize Logging ---
  LogManager::instance().configure(current_config->logging);

  LOG(LogLevel::INFO, LogComponent::CORE, "textguard starting up...");
  LOG(LogLevel::DEBUG, LogComponent::CORE, "PID: " << getpid());

  // --- Load the Dictionary ---
  Dictionary::DictionaryStore dictionary_store;
  TextService text_service(dictionary_store, *current_config);
  try {
    text_service.reload();
  } catch (const Dictionary::LoadError &e) {
    LOG(LogLevel::FATAL, LogComponent::CORE,
        "Failed to load the initial dictionary: " << e.what() << ". Exiting.");
    return 1;
  }

  // --- Web Server Initialization ---
  std::unique_ptr<WebServer> web_server;
  if (current_config->server.enabled) {
    web_server = std::make_unique<WebServer>(*current_config, text_service);
    if (!web_server->start()) {
      LOG(LogLevel::FATAL, LogComponent::CORE,
          "Failed to start the web server. Exiting.");
      return 1;
    }
  } else {
    LOG(LogLevel::WARN, LogComponent::CORE,
        "Web server disabled by configuration; only SIGHUP reloads are "
        "served.");
  }

  LOG(LogLevel::INFO, LogComponent::CORE,
      "Ready. Send SIGHUP to reload configuration and dictionary.");

  while (!g_shutdown_requested) {
    if (g_reload_requested.exchange(false)) {
      LOG(LogLevel::INFO, LogComponent::CORE,
          "SIGHUP detected. Reloading configuration from "
              << config_file_to_load << "...");
      if (config_manager.load_configuration(config_file_to_load)) {
        current_config = config_manager.get_config();
        LogManager::instance().configure(current_config->logging);
        text_service.reconfigure(*current_config);
        LOG(LogLevel::INFO, LogComponent::CONFIG,
            "Configuration reloaded. Server settings take effect on restart.");
      } else
        LOG(LogLevel::ERROR, LogComponent::CONFIG,
            "Failed to reload configuration. Keeping old settings.");

      try {
        text_service.reload();
      } catch (const Dictionary::LoadError &e) {
        LOG(LogLevel::ERROR, LogComponent::CORE,
            "Dictionary reload failed, still serving version "
                << text_service.snapshot()->version << ": " << e.what());
      }
    }

    std::this_thread::sleep_for(std::chrono::milliseconds(200));
  }

  LOG(LogLevel::INFO, LogComponent::CORE, "Shutdown requested.");
  if (web_server)
    web_server->stop();
  LOG(LogLevel::INFO, LogComponent::CORE, "textguard shut down cleanly.");
  return 0;
}
