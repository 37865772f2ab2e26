#pragma once
#include <pipedag/http.hpp>

#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <string>

namespace pipedag {

class Server {
public:
  using Handler = std::function<http::Response(const http::Request &)>;

  // Binds immediately; throws asio::system_error when the address is unusable.
  // A connection that has not delivered its request within read_timeout is
  // answered with 408.
  Server(const std::string &addr, unsigned short port, Handler h,
         unsigned threads = 0, std::size_t max_body_bytes = 8 * 1024 * 1024,
         std::chrono::milliseconds read_timeout = std::chrono::seconds(10));
  ~Server();

  unsigned short port() const;
  void stop_on_signals();
  // Returns once stop() or a signal has closed the listener and every
  // in-flight connection has been answered or dropped.
  void run();
  void stop();

private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
};

} // namespace pipedag
