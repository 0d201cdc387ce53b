#pragma once
#include <crow.h>

#include <future>
#include <string>

namespace facefind_api {
class Server {
 public:
  // `http_threads` of 0 lets Crow pick one thread per hardware core.
  Server(const std::string &host, int port, unsigned int http_threads = 0);
  ~Server() = default;

  // crow::SimpleApp is neither copyable nor movable
  Server(const Server &) = delete;
  Server &operator=(const Server &) = delete;
  Server(Server &&) = delete;
  Server &operator=(Server &&) = delete;

  crow::SimpleApp &get_app() {
    return app_;
  }

  void start();

  void stop();

  bool is_running() const {
    return running_;
  }

 private:
  crow::SimpleApp app_;
  std::string host_;
  int port_;
  unsigned int http_threads_;
  std::future<void> server_thread_future_;
  bool running_ = false;
};
}  // namespace facefind_api
