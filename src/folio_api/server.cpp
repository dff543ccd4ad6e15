#include "folio_api/server.hpp"

#include <iostream>
#include <stdexcept>
#include <utility>

namespace folio_api {

Server::Server(ListenAddress address, std::uint16_t worker_threads)
    : address_(std::move(address)), worker_threads_(worker_threads) {}

ListenAddress Server::parse_listen_address(const std::string &api_base_url) {
  // The last colon separates the port, so "localhost:3030" and "::1:3030" both parse
  const auto colon = api_base_url.rfind(':');
  if (colon == std::string::npos || colon == 0 || colon + 1 == api_base_url.size()) {
    throw std::invalid_argument("Listen address must be host:port, got '" + api_base_url + "'");
  }

  const std::string port_text = api_base_url.substr(colon + 1);
  if (port_text.find_first_not_of("0123456789") != std::string::npos || port_text.size() > 5) {
    throw std::invalid_argument("Listen port must be a number, got '" + port_text + "'");
  }
  const int port = std::stoi(port_text);
  if (port < 1 || port > 65535) {
    throw std::invalid_argument("Listen port out of range: " + port_text);
  }
  return {api_base_url.substr(0, colon), port};
}

void Server::start() {
  if (running_) {
    return;
  }
  running_ = true;

  app_.port(static_cast<std::uint16_t>(address_.port)).bindaddr(address_.host);
  if (worker_threads_ > 0) {
    app_.concurrency(worker_threads_);
  } else {
    app_.multithreaded();
  }
  std::cout << "Folio API listening on " << address_.host << ":" << address_.port << " with "
            << (worker_threads_ > 0 ? std::to_string(worker_threads_) : std::string("hardware"))
            << " worker threads" << std::endl;
  server_thread_future_ = std::async(std::launch::async, [this] { app_.run(); });
}

void Server::stop() {
  if (!running_) {
    return;
  }
  std::cout << "Stopping Folio API on " << address_.host << ":" << address_.port << std::endl;
  app_.stop();

  // Rethrows anything the server thread ended with
  if (server_thread_future_.valid()) {
    server_thread_future_.get();
  }
  running_ = false;
}

}  // namespace folio_api
