#pragma once
#include <crow.h>

#include <atomic>
#include <future>
#include <string>

namespace rag_api {

class ServerError : public std::exception {
 public:
  explicit ServerError(const std::string &message) : message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

/**
 * Crow application bound to one host:port and run on a background thread.
 * Signal handling is left to the caller; Crow's own handlers are cleared on start.
 */
class Server {
 public:
  // Throws ServerError for an unknown log level name
  Server(const std::string &host, int port, const std::string &log_level = "warning");
  ~Server() = default;

  // Disable move and copy operations since crow::SimpleApp doesn't support them
  Server(const Server &) = delete;
  Server &operator=(const Server &) = delete;
  Server(Server &&) = delete;
  Server &operator=(Server &&) = delete;

  crow::SimpleApp &get_app() {
    return app_;
  }

  void start();

  // Stops the app and waits for the run loop. Throws ServerError if the loop
  // ended with an error (e.g. the port could not be bound).
  void stop();

  bool is_running() const {
    return running_;
  }

  std::string address() const {
    return host_ + ":" + std::to_string(port_);
  }

  // "debug", "info", "warning", "error" or "critical"
  static crow::LogLevel parse_log_level(const std::string &name);

 private:
  crow::SimpleApp app_;
  std::string host_;
  int port_;
  crow::LogLevel log_level_;
  std::future<void> run_future_;
  std::atomic<bool> running_ = false;
};
}  // namespace rag_api
