#include "rag_api/server.hpp"

#include <iostream>

namespace rag_api {

Server::Server(const std::string &host, int port, const std::string &log_level)
    : host_(host), port_(port), log_level_(parse_log_level(log_level)) {}

crow::LogLevel Server::parse_log_level(const std::string &name) {
  if (name == "debug") return crow::LogLevel::Debug;
  if (name == "info") return crow::LogLevel::Info;
  if (name == "warning") return crow::LogLevel::Warning;
  if (name == "error") return crow::LogLevel::Error;
  if (name == "critical") return crow::LogLevel::Critical;
  throw ServerError("Unknown log level: " + name);
}

void Server::start() {
  if (running_) {
    return;
  }
  app_.loglevel(log_level_);
  app_.signal_clear();

  running_ = true;
  std::cout << "API listening on http://" << address() << std::endl;
  run_future_ = std::async(std::launch::async, [this] { app_.port(port_).bindaddr(host_).run(); });
}

void Server::stop() {
  if (!running_) {
    return;
  }
  app_.stop();
  running_ = false;

  if (run_future_.valid()) {
    try {
      run_future_.get();
    } catch (const std::exception &e) {
      throw ServerError("Server on " + address() + " stopped with an error: " + e.what());
    }
  }
}

}  // namespace rag_api
