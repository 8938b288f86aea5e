#ifndef LOGGER_HPP
#define LOGGER_HPP

#include "config.hpp"

#include <chrono>
#include <ctime>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <map>
#include <mutex>
#include <sstream>
#include <string>
#include <system_error>

// Enum for standard log severity levels
enum class LogLevel { TRACE, DEBUG, INFO, WARN, ERROR, FATAL };

// Enum for all granular application components
enum class LogComponent {
  // Top-level components
  CORE,
  CONFIG,

  // Dictionary sub-components
  DICT_LOADER,
  DICT_AUTOMATON,
  DICT_STORE,

  // Request handling
  SERVICE,
  WEB
};

class LogManager {
public:
  static LogManager &instance() {
    static LogManager instance;
    return instance;
  }

  inline void configure(const Config::LoggingConfig &config) {
    std::lock_guard<std::mutex> lock(sink_mutex_);
    log_levels_ = config.log_levels;
    max_file_bytes_ = config.log_max_size_bytes;
    max_backups_ = config.log_max_backups;
    if (config.log_file != log_file_path_) {
      if (log_file_.is_open())
        log_file_.close();
      log_file_path_ = config.log_file;
      if (!log_file_path_.empty())
        open_log_file();
    }
  }

  bool should_log(LogLevel level, LogComponent component) const {
    std::lock_guard<std::mutex> lock(sink_mutex_);
    auto it = log_levels_.find(component);
    if (it == log_levels_.end())
      return false;

    return level >= it->second;
  }

  void write(const std::string &line) {
    std::lock_guard<std::mutex> lock(sink_mutex_);
    if (!log_file_.is_open()) {
      std::cout << line << std::endl;
      return;
    }

    if (max_file_bytes_ > 0 && bytes_written_ > 0 &&
        bytes_written_ + line.size() + 1 > max_file_bytes_)
      rotate_log_file();
    log_file_ << line << std::endl;
    bytes_written_ += line.size() + 1;
  }

private:
  LogManager() = default; // Private constructor for singleton

  void open_log_file() {
    log_file_.open(log_file_path_, std::ios::app);
    if (!log_file_.is_open()) {
      std::cerr << "Warning: Could not open log file '" << log_file_path_
                << "'. Logging to stdout." << std::endl;
      return;
    }
    std::error_code ec;
    auto size = std::filesystem::file_size(log_file_path_, ec);
    bytes_written_ = ec ? 0 : size;
  }

  // Shifts app.log -> app.log.1 -> ... -> app.log.N, dropping the oldest.
  void rotate_log_file() {
    log_file_.close();
    std::error_code ec;
    if (max_backups_ == 0) {
      std::filesystem::remove(log_file_path_, ec);
    } else {
      std::filesystem::remove(backup_path(max_backups_), ec);
      for (size_t i = max_backups_; i > 1; --i)
        std::filesystem::rename(backup_path(i - 1), backup_path(i), ec);
      ec.clear();
      std::filesystem::rename(log_file_path_, backup_path(1), ec);
    }
    if (ec)
      std::cerr << "Warning: Could not rotate log file '" << log_file_path_
                << "': " << ec.message() << std::endl;
    bytes_written_ = 0;
    open_log_file();
  }

  std::string backup_path(size_t index) const {
    return log_file_path_ + "." + std::to_string(index);
  }

  std::map<LogComponent, LogLevel> log_levels_;
  std::string log_file_path_;
  std::ofstream log_file_;
  uint64_t bytes_written_ = 0;
  uint64_t max_file_bytes_ = 0;
  size_t max_backups_ = 0;
  mutable std::mutex sink_mutex_;
};

// --- The Core Logging Macro ---
// If `should_log` returns false the message expression is never evaluated.
#define LOG(level, component, message)                                         \
  do {                                                                         \
    if (LogManager::instance().should_log(level, component)) {                 \
      auto now = std::chrono::system_clock::now();                             \
      auto time_t_now = std::chrono::system_clock::to_time_t(now);             \
      auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(         \
                    now.time_since_epoch()) %                                  \
                1000;                                                          \
      std::tm tm_utc{};                                                        \
      gmtime_r(&time_t_now, &tm_utc);                                          \
      std::ostringstream oss;                                                  \
      oss << std::put_time(&tm_utc, "%Y-%m-%dT%H:%M:%S") << '.'               \
          << std::setw(3) << std::setfill('0') << ms.count() << "Z ";          \
      oss << "[" << level_to_string(level) << "] ";                            \
      oss << "[" << component_to_string(component) << "] ";                    \
      oss << "[" << __FILE__ << ":" << __LINE__ << "] ";                       \
      oss << message;                                                          \
      LogManager::instance().write(oss.str());                                 \
    }                                                                          \
  } while (0)

// --- Helper Functions to Convert Enums to Strings for Printing ---

inline const char *level_to_string(LogLevel level) {
  switch (level) {
  case LogLevel::TRACE:
    return "TRACE";
  case LogLevel::DEBUG:
    return "DEBUG";
  case LogLevel::INFO:
    return "INFO";
  case LogLevel::WARN:
    return "WARN";
  case LogLevel::ERROR:
    return "ERROR";
  case LogLevel::FATAL:
    return "FATAL";
  }
  return "UNKNOWN";
}

inline const char *component_to_string(LogComponent component) {
  switch (component) {
  case LogComponent::CORE:
    return "CORE";
  case LogComponent::CONFIG:
    return "CONFIG";
  case LogComponent::DICT_LOADER:
    return "DICT.LOADER";
  case LogComponent::DICT_AUTOMATON:
    return "DICT.AUTOMATON";
  case LogComponent::DICT_STORE:
    return "DICT.STORE";
  case LogComponent::SERVICE:
    return "SERVICE";
  case LogComponent::WEB:
    return "WEB";
  }
  return "GENERAL";
}

#endif // LOGGER_HPP
