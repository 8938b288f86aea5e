#include "web_server.hpp"
#include "core/logger.hpp"
#include "core/metrics_registry.hpp"
#include "dictionary/dictionary_loader.hpp"
#include "utils/utf8.hpp"
#include "utils/utils.hpp"

#include <algorithm>
#include <chrono>
#include <exception>
#include <thread>

WebServer::WebServer(const Config::AppConfig &config,
                     TextService &text_service)
    : host_(config.server.host), port_(config.server.port),
      thread_pool_size_(config.server.thread_pool_size),
      prometheus_enabled_(config.prometheus.enabled),
      metrics_path_(config.prometheus.metrics_path),
      text_service_(text_service) {
  server_ = std::make_unique<httplib::Server>();

  size_t pool_size = thread_pool_size_;
  if (pool_size == 0)
    pool_size = std::max(1u, std::thread::hardware_concurrency());
  server_->new_task_queue = [pool_size] {
    return new httplib::ThreadPool(pool_size);
  };

  register_routes();

  LOG(LogLevel::INFO, LogComponent::WEB,
      "Web server initialized for " << host_ << ":" << port_ << " with "
                                    << pool_size << " worker threads");
}

WebServer::~WebServer() { stop(); }

std::optional<std::string>
WebServer::extract_message(const httplib::Request &req) {
  auto content_type = req.get_header_value("Content-Type");
  if (content_type.find("application/json") != std::string::npos) {
    auto body = nlohmann::json::parse(req.body, nullptr, false);
    if (body.is_discarded() || !body.is_object())
      return std::nullopt;
    auto it = body.find("message");
    if (it == body.end() || !it->is_string())
      return std::nullopt;
    return it->get<std::string>();
  }

  // Covers both the query string and application/x-www-form-urlencoded
  if (req.has_param("message"))
    return req.get_param_value("message");
  return std::nullopt;
}

void WebServer::send_json(httplib::Response &res, const nlohmann::json &body,
                          int status) {
  res.status = status;
  // Replace invalid UTF-8 instead of throwing from dump()
  res.set_content(body.dump(-1, ' ', false,
                            nlohmann::json::error_handler_t::replace),
                  "application/json");
}

void WebServer::register_routes() {
  server_->Post("/validate", [this](const httplib::Request &req,
                                    httplib::Response &res) {
    LOG(LogLevel::DEBUG, LogComponent::WEB,
        "WebServer: Received /validate from " << req.remote_addr);
    auto message = extract_message(req);
    if (!message) {
      send_json(res, {{"error", "missing 'message' field"}}, 400);
      return;
    }
    send_json(res, {{"result", text_service_.validate(*message)}});
  });

  server_->Post("/filter", [this](const httplib::Request &req,
                                  httplib::Response &res) {
    LOG(LogLevel::DEBUG, LogComponent::WEB,
        "WebServer: Received /filter from " << req.remote_addr);
    auto message = extract_message(req);
    if (!message) {
      send_json(res, {{"error", "missing 'message' field"}}, 400);
      return;
    }
    send_json(res, {{"result", text_service_.filter(*message)}});
  });

  server_->Get("/api/v1/dictionary",
               [this](const httplib::Request &, httplib::Response &res) {
                 auto snapshot = text_service_.snapshot();
                 auto built_at_ms =
                     std::chrono::duration_cast<std::chrono::milliseconds>(
                         snapshot->built_at.time_since_epoch())
                         .count();

                 nlohmann::json j;
                 j["version"] = snapshot->version;
                 j["word_count"] = snapshot->word_count;
                 j["built_at"] = Utils::format_iso8601_utc(
                     static_cast<uint64_t>(built_at_ms));
                 j["pattern"] = snapshot->source_pattern;
                 j["source_files"] = snapshot->source_files;
                 j["lines_read"] = snapshot->lines_read;
                 j["mask_char"] = Utils::u32_to_utf8(
                     std::u32string(1, snapshot->mask_char));
                 j["warnings"] = snapshot->warnings;
                 send_json(res, j);
               });

  server_->Post("/api/v1/dictionary/reload",
                [this](const httplib::Request &req, httplib::Response &res) {
                  LOG(LogLevel::INFO, LogComponent::WEB,
                      "WebServer: Dictionary reload requested by "
                          << req.remote_addr);
                  try {
                    size_t word_count = text_service_.reload();
                    send_json(res,
                              {{"word_count", word_count},
                               {"version", text_service_.snapshot()->version}});
                  } catch (const Dictionary::LoadError &e) {
                    send_json(res, {{"error", e.what()}}, 500);
                  }
                });

  if (prometheus_enabled_) {
    server_->Get(metrics_path_, [](const httplib::Request &req,
                                   httplib::Response &res) {
      LOG(LogLevel::DEBUG, LogComponent::WEB,
          "WebServer: Received request for metrics from " << req.remote_addr);
      res.set_content(MetricsRegistry::instance().serialize(),
                      "text/plain; version=0.0.4");
    });
  }

  server_->set_exception_handler([](const httplib::Request &req,
                                    httplib::Response &res,
                                    std::exception_ptr ep) {
    std::string reason = "unknown error";
    try {
      std::rethrow_exception(ep);
    } catch (const std::exception &e) {
      reason = e.what();
    } catch (...) {
      reason = "non-standard exception";
    }
    LOG(LogLevel::ERROR, LogComponent::WEB,
        "WebServer: Handler for " << req.path << " failed: " << reason);
    send_json(res, {{"error", "internal error"}}, 500);
  });
}

bool WebServer::start() {
  if (server_thread_.joinable())
    return true; // Already running

  if (port_ == 0) {
    bound_port_ = server_->bind_to_any_port(host_);
  } else if (server_->bind_to_port(host_, port_)) {
    bound_port_ = port_;
  }

  if (bound_port_ <= 0) {
    LOG(LogLevel::FATAL, LogComponent::WEB,
        "Web server failed to bind " << host_ << ":" << port_);
    return false;
  }

  server_thread_ = std::thread(&WebServer::run, this);
  LOG(LogLevel::INFO, LogComponent::WEB,
      "Web server listening on " << host_ << ":" << bound_port_);
  return true;
}

void WebServer::stop() {
  if (!server_thread_.joinable())
    return;

  LOG(LogLevel::INFO, LogComponent::WEB, "Web server stopping...");
  server_->stop();
  server_thread_.join();
}

void WebServer::run() {
  if (!server_->listen_after_bind()) {
    LOG(LogLevel::ERROR, LogComponent::WEB,
        "Web server on " << host_ << ":" << bound_port_
                         << " stopped listening");
  }
}
