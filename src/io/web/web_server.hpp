#ifndef WEB_SERVER_HPP
#define WEB_SERVER_HPP

#include "core/config.hpp"
#include "service/text_service.hpp"

#include <httplib.h>
#include <nlohmann/json.hpp>

#include <atomic>
#include <memory>
#include <optional>
#include <string>
#include <thread>

class WebServer {
public:
  WebServer(const Config::AppConfig &config, TextService &text_service);
  ~WebServer();

  WebServer(const WebServer &) = delete;
  WebServer &operator=(const WebServer &) = delete;

  // Binds synchronously so callers learn about a busy port right away, then
  // serves on a background thread.
  bool start();
  void stop();
  int port() const { return bound_port_; }

  // Reads the "message" field from a JSON body, a form body or the query.
  static std::optional<std::string> extract_message(const httplib::Request &req);

private:
  void register_routes();
  void run();

  static void send_json(httplib::Response &res, const nlohmann::json &body,
                        int status = 200);

  std::unique_ptr<httplib::Server> server_;
  std::thread server_thread_;
  std::string host_;
  int port_;
  int bound_port_ = -1;
  size_t thread_pool_size_;
  bool prometheus_enabled_;
  std::string metrics_path_;
  TextService &text_service_;
};

#endif // WEB_SERVER_HPP
