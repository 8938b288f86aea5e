#ifndef CONFIG_HPP
#define CONFIG_HPP

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

enum class LogLevel;
enum class LogComponent;

namespace Config {

namespace Keys {

// Dictionary Settings
constexpr const char *DICT_PATH = "path";
constexpr const char *DICT_COMMENT_PREFIX = "comment_prefix";
constexpr const char *DICT_MASK_CHAR = "mask_char";
constexpr const char *DICT_REQUIRE_FILES = "require_files";

// Server Settings
constexpr const char *SERVER_ENABLED = "enabled";
constexpr const char *SERVER_HOST = "host";
constexpr const char *SERVER_PORT = "port";
constexpr const char *SERVER_THREAD_POOL_SIZE = "thread_pool_size";

// Logging Settings
constexpr const char *LOGGING_DEFAULT_LEVEL = "default_level";
constexpr const char *LOGGING_LOG_FILE = "log_file";
constexpr const char *LOGGING_LOG_MAX_SIZE_MB = "log_max_size_mb";
constexpr const char *LOGGING_LOG_MAX_BACKUPS = "log_max_backups";
constexpr const char *LOGGING_LOG_REQUEST_TEXT = "log_request_text";

// Prometheus Settings
constexpr const char *PROMETHEUS_ENABLED = "enabled";
constexpr const char *PROMETHEUS_METRICS_PATH = "metrics_path";
} // namespace Keys

struct LoggingConfig {
  std::map<LogComponent, LogLevel> log_levels;
  std::string log_file;
  // The file is rotated once it would grow past this size; 0 disables.
  uint64_t log_max_size_bytes = 100ULL * 1024 * 1024;
  size_t log_max_backups = 3;
  bool log_request_text = false;
};

struct DictionaryConfig {
  std::string path = "*.txt";
  std::string comment_prefix = "#";
  // Stored as UTF-8; validation guarantees exactly one code point.
  std::string mask_char = "*";
  bool require_files = true;
};

struct ServerConfig {
  bool enabled = true;
  std::string host = "0.0.0.0";
  int port = 8000;
  // 0 selects std::thread::hardware_concurrency()
  size_t thread_pool_size = 0;
};

struct PrometheusConfig {
  bool enabled = true;
  std::string metrics_path = "/metrics";
};

struct AppConfig {
  DictionaryConfig dictionary;
  ServerConfig server;
  LoggingConfig logging;
  PrometheusConfig prometheus;

  AppConfig();
};

LogLevel string_to_log_level(const std::string &level_str_raw);
char32_t mask_code_point(const DictionaryConfig &config);

// Validation functions for configuration parameters
bool validate_dictionary_config(const DictionaryConfig &config,
                                std::vector<std::string> &errors);
bool validate_server_config(const ServerConfig &config,
                            std::vector<std::string> &errors);
bool validate_prometheus_config(const PrometheusConfig &config,
                                std::vector<std::string> &errors);
bool validate_app_config(const AppConfig &config,
                         std::vector<std::string> &errors);

bool parse_config_into(const std::string &filepath, AppConfig &config);

class ConfigManager {
public:
  ConfigManager();
  bool load_configuration(const std::string &filepath);
  std::shared_ptr<const AppConfig> get_config() const;

private:
  std::string config_filepath_;
  std::shared_ptr<const AppConfig> current_config_;
  mutable std::mutex config_mutex_;
};

} // namespace Config

#endif // CONFIG_HPP
