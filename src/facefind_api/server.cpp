#include "facefind_api/server.hpp"

#include <cstdint>
#include <iostream>

namespace facefind_api {
Server::Server(const std::string &host, int port, unsigned int http_threads)
    : host_(host), port_(port), http_threads_(http_threads), running_(false) {}

void Server::start() {
  if (running_) {
    return;
  }
  running_ = true;
  std::cout << "FaceFind API listening on " << host_ << ":" << port_ << " with "
            << (http_threads_ > 0 ? std::to_string(http_threads_) : std::string("default"))
            << " HTTP threads" << std::endl;
  server_thread_future_ = std::async(std::launch::async, [this] {
    auto &app = app_.port(static_cast<uint16_t>(port_)).bindaddr(host_);
    if (http_threads_ > 0) {
      app.concurrency(static_cast<std::uint16_t>(http_threads_)).run();
    } else {
      app.multithreaded().run();
    }
  });
}

void Server::stop() {
  if (!running_) {
    return;
  }
  app_.stop();

  // Rethrows a bind failure from the server thread
  if (server_thread_future_.valid()) {
    server_thread_future_.get();
  }
  running_ = false;
}
}  // namespace facefind_api
