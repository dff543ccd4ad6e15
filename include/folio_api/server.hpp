#pragma once
#include <crow.h>

#include <cstdint>
#include <future>
#include <string>

namespace folio_api {

struct ListenAddress {
  std::string host;
  int port = 0;
};

/**
 * @brief Owns the Crow app that serves the Folio HTTP API.
 *
 * The app runs on a background thread between start() and stop(), with
 * worker_threads request handlers (0 lets Crow use one per hardware thread).
 */
class Server {
 public:
  Server(ListenAddress address, std::uint16_t worker_threads = 0);
  ~Server() = default;

  // crow::SimpleApp is neither copyable nor movable
  Server(const Server &) = delete;
  Server &operator=(const Server &) = delete;
  Server(Server &&) = delete;
  Server &operator=(Server &&) = delete;

  // Parses "host:port" as written in api_base_url. Throws std::invalid_argument.
  static ListenAddress parse_listen_address(const std::string &api_base_url);

  crow::SimpleApp &get_app() {
    return app_;
  }

  const ListenAddress &address() const {
    return address_;
  }

  void start();
  void stop();

  bool is_running() const {
    return running_;
  }

 private:
  crow::SimpleApp app_;
  ListenAddress address_;
  std::uint16_t worker_threads_;
  std::future<void> server_thread_future_;
  bool running_ = false;
};
}  // namespace folio_api
