#include "config.hpp"
#include "logger.hpp"
#include "utils/utf8.hpp"
#include "utils/utils.hpp"

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <fstream>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace Config {

LogLevel string_to_log_level(const std::string &level_str_raw) {
  std::string level_str = Utils::trim_copy(level_str_raw);
  std::transform(level_str.begin(), level_str.end(), level_str.begin(),
                 ::toupper);
  if (level_str == "TRACE")
    return LogLevel::TRACE;
  if (level_str == "DEBUG")
    return LogLevel::DEBUG;
  if (level_str == "INFO")
    return LogLevel::INFO;
  if (level_str == "WARN")
    return LogLevel::WARN;
  if (level_str == "ERROR")
    return LogLevel::ERROR;
  if (level_str == "FATAL")
    return LogLevel::FATAL;
  return LogLevel::INFO; // A safe default
}

const std::map<std::string, LogComponent> key_to_component_map = {
    {"core", LogComponent::CORE},
    {"config", LogComponent::CONFIG},
    {"dict.loader", LogComponent::DICT_LOADER},
    {"dict.automaton", LogComponent::DICT_AUTOMATON},
    {"dict.store", LogComponent::DICT_STORE},
    {"service", LogComponent::SERVICE},
    {"web", LogComponent::WEB}};

// Convert string to boolean using common truthy values
bool string_to_bool(const std::string &val_str_raw) {
  std::string val_str = Utils::to_lower_ascii(Utils::trim_copy(val_str_raw));
  return (val_str == "true" || val_str == "1" || val_str == "yes" ||
          val_str == "on");
}

AppConfig::AppConfig() {
  // Everything defaults to WARN except CORE, which reports INFO
  for (const auto &pair : key_to_component_map)
    logging.log_levels[pair.second] = LogLevel::WARN;
  logging.log_levels[LogComponent::CORE] = LogLevel::INFO;
}

char32_t mask_code_point(const DictionaryConfig &config) {
  std::u32string decoded = Utils::utf8_to_u32(config.mask_char);
  if (decoded.size() != 1)
    return U'*';
  return decoded.front();
}

bool validate_dictionary_config(const DictionaryConfig &config,
                                std::vector<std::string> &errors) {
  bool valid = true;

  if (Utils::trim_copy(config.path).empty()) {
    errors.push_back("Dictionary path must not be empty");
    valid = false;
  }

  if (!Utils::is_valid_utf8(config.mask_char) ||
      Utils::count_code_points(config.mask_char) != 1) {
    errors.push_back("Dictionary mask_char must be exactly one character");
    valid = false;
  } else if (Utils::is_unicode_space(Utils::utf8_to_u32(config.mask_char)[0])) {
    errors.push_back("Dictionary mask_char must not be whitespace");
    valid = false;
  }

  if (!Utils::is_valid_utf8(config.comment_prefix)) {
    errors.push_back("Dictionary comment_prefix must be valid UTF-8");
    valid = false;
  }

  return valid;
}

bool validate_server_config(const ServerConfig &config,
                            std::vector<std::string> &errors) {
  bool valid = true;

  if (config.port < 1 || config.port > 65535) {
    errors.push_back("Server port must be between 1 and 65535");
    valid = false;
  }

  if (config.host.empty()) {
    errors.push_back("Server host must not be empty");
    valid = false;
  }

  if (config.thread_pool_size > 1024) {
    errors.push_back("Server thread_pool_size must not exceed 1024");
    valid = false;
  }

  return valid;
}

bool validate_prometheus_config(const PrometheusConfig &config,
                                std::vector<std::string> &errors) {
  if (config.metrics_path.empty() || config.metrics_path[0] != '/') {
    errors.push_back("Prometheus metrics path must start with '/'");
    return false;
  }
  return true;
}

bool validate_app_config(const AppConfig &config,
                         std::vector<std::string> &errors) {
  bool valid = true;

  valid &= validate_dictionary_config(config.dictionary, errors);
  valid &= validate_server_config(config.server, errors);
  valid &= validate_prometheus_config(config.prometheus, errors);

  // The API routes are fixed, so the metrics endpoint cannot shadow them
  if (config.prometheus.enabled &&
      (config.prometheus.metrics_path == "/validate" ||
       config.prometheus.metrics_path == "/filter" ||
       Utils::starts_with(config.prometheus.metrics_path, "/api/"))) {
    errors.push_back("Prometheus metrics path collides with an API route");
    valid = false;
  }

  return valid;
}

bool parse_config_into(const std::string &filepath, AppConfig &config) {
  std::cout << "Attempting to load configuration from " << filepath
            << std::endl;
  std::ifstream config_file(filepath);

  if (!config_file.is_open()) {
    std::cerr << "Warning: Could not open config file '" << filepath
              << "'. Using default configuration values." << std::endl;
    return false;
  }

  std::string line;
  std::string current_section;

  int line_num = 0;
  while (std::getline(config_file, line)) {
    line_num++;
    std::string trimmed_line = Utils::trim_copy(line);

    // Skip empty lines and comments
    if (trimmed_line.empty() || trimmed_line[0] == '#' ||
        trimmed_line[0] == ';')
      continue;

    // Section header [SectionName]
    if (trimmed_line[0] == '[' && trimmed_line.back() == ']') {
      current_section =
          Utils::trim_copy(trimmed_line.substr(1, trimmed_line.length() - 2));
      continue;
    }

    // Key-value pair parsing
    size_t delimiter_pos = trimmed_line.find('=');
    if (delimiter_pos == std::string::npos) {
      std::cerr << "Warning (Config Line " << line_num
                << "): Invalid format (missing '='): " << trimmed_line
                << std::endl;
      continue;
    }

    std::string key = Utils::trim_copy(trimmed_line.substr(0, delimiter_pos));
    std::string value =
        Utils::trim_copy(trimmed_line.substr(delimiter_pos + 1));

    if (key.empty()) {
      std::cerr << "Warning (Config Line " << line_num << "): Empty key found."
                << std::endl;
      continue;
    }

    try {
      if (current_section == "Dictionary") {
        if (key == Keys::DICT_PATH)
          config.dictionary.path = value;
        else if (key == Keys::DICT_COMMENT_PREFIX)
          config.dictionary.comment_prefix = value;
        else if (key == Keys::DICT_MASK_CHAR)
          config.dictionary.mask_char = value;
        else if (key == Keys::DICT_REQUIRE_FILES)
          config.dictionary.require_files = string_to_bool(value);

      } else if (current_section == "Server") {
        if (key == Keys::SERVER_ENABLED)
          config.server.enabled = string_to_bool(value);
        else if (key == Keys::SERVER_HOST)
          config.server.host = value;
        else if (key == Keys::SERVER_PORT)
          config.server.port = Utils::string_to_number<int>(value).value_or(
              config.server.port);
        else if (key == Keys::SERVER_THREAD_POOL_SIZE)
          config.server.thread_pool_size =
              Utils::string_to_number<size_t>(value).value_or(
                  config.server.thread_pool_size);

      } else if (current_section == "Logging") {
        if (key == Keys::LOGGING_DEFAULT_LEVEL) {
          LogLevel default_level = string_to_log_level(value);
          for (auto &pair : config.logging.log_levels)
            pair.second = default_level;
        } else if (key == Keys::LOGGING_LOG_FILE) {
          config.logging.log_file = value;
        } else if (key == Keys::LOGGING_LOG_MAX_SIZE_MB) {
          auto megabytes = Utils::string_to_number<uint64_t>(value);
          if (megabytes)
            config.logging.log_max_size_bytes = *megabytes * 1024 * 1024;
        } else if (key == Keys::LOGGING_LOG_MAX_BACKUPS) {
          config.logging.log_max_backups =
              Utils::string_to_number<size_t>(value).value_or(
                  config.logging.log_max_backups);
        } else if (key == Keys::LOGGING_LOG_REQUEST_TEXT) {
          config.logging.log_request_text = string_to_bool(value);
        } else {
          auto comp_it = key_to_component_map.find(key);
          if (comp_it != key_to_component_map.end())
            config.logging.log_levels[comp_it->second] =
                string_to_log_level(value);
          else if (key.length() > 2 && key.substr(key.length() - 2) == ".*") {
            // Wildcard match, e.g., "dict.* = DEBUG"
            std::string prefix = key.substr(0, key.length() - 1);
            for (const auto &pair : key_to_component_map) {
              if (Utils::starts_with(pair.first, prefix))
                config.logging.log_levels[pair.second] =
                    string_to_log_level(value);
            }
          } else {
            std::cerr << "Warning (Config Line " << line_num
                      << "): Unknown logging component '" << key << "'"
                      << std::endl;
          }
        }

      } else if (current_section == "Prometheus") {
        if (key == Keys::PROMETHEUS_ENABLED)
          config.prometheus.enabled = string_to_bool(value);
        else if (key == Keys::PROMETHEUS_METRICS_PATH)
          config.prometheus.metrics_path = value;

      } else {
        std::cerr << "Warning (Config Line " << line_num
                  << "): Key '" << key << "' outside a known section"
                  << std::endl;
      }
    } catch (const std::exception &e) {
      std::cerr << "Warning (Config Line " << line_num
                << "): Failed to parse value for key '" << key << "' - "
                << e.what() << std::endl;
    }
  }

  config_file.close();
  std::cout << "Configuration loaded successfully from " << filepath
            << std::endl;
  return true;
}

ConfigManager::ConfigManager()
    : current_config_(std::make_shared<AppConfig>()) {}

bool ConfigManager::load_configuration(const std::string &filepath) {
  config_filepath_ = filepath;
  auto new_config = std::make_shared<AppConfig>();

  // Use the parsing logic to fill the new config object
  if (!parse_config_into(filepath, *new_config)) {
    std::cerr << "Failed to parse configuration file: " << filepath
              << ". Keeping existing settings." << std::endl;
    return false;
  }

  // Validate the configuration
  std::vector<std::string> validation_errors;
  if (!validate_app_config(*new_config, validation_errors)) {
    std::cerr << "Configuration validation failed:" << std::endl;
    for (const auto &error : validation_errors) {
      std::cerr << "  - " << error << std::endl;
    }
    std::cerr << "Keeping existing settings." << std::endl;
    return false;
  }

  // Atomically swap the pointer
  std::lock_guard<std::mutex> lock(config_mutex_);
  current_config_ = new_config;
  std::cout << "Configuration loaded and validated successfully from "
            << config_filepath_ << std::endl;
  return true;
}

std::shared_ptr<const AppConfig> ConfigManager::get_config() const {
  std::lock_guard<std::mutex> lock(config_mutex_);
  return current_config_;
}

} // namespace Config
