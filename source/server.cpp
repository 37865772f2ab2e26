#include <pipedag/server.hpp>
#include <pipedag/thread_pool.hpp>

#include <asio.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <atomic>
#include <csignal>
#include <mutex>
#include <set>
#include <sstream>

namespace pipedag {

namespace {

constexpr std::size_t kMaxHeaderBytes = 64 * 1024;
constexpr std::size_t kBodyChunk = 64 * 1024;

enum class ReadResult { Ok, Closed, Malformed, TooLarge };

// One accepted socket plus the deadline that bounds reading its request.
struct Conn {
  asio::ip::tcp::socket sock;
  asio::steady_timer deadline;
  std::atomic<bool> expired{false};

  Conn(asio::ip::tcp::socket s, asio::io_context &io)
      : sock(std::move(s)), deadline(io) {}

  // Unblocks a worker parked in a read on this socket; writes still work.
  void close_read() {
    asio::error_code ec;
    sock.shutdown(asio::ip::tcp::socket::shutdown_receive, ec);
  }
};

void strip_cr(std::string &line) {
  if (!line.empty() && line.back() == '\r')
    line.pop_back();
}

bool parse_length(const std::string &v, std::size_t &out) {
  if (v.empty() || v.find_first_not_of("0123456789") != std::string::npos)
    return false;
  try {
    out = static_cast<std::size_t>(std::stoull(v));
  } catch (const std::out_of_range &) {
    return false;
  }
  return true;
}

ReadResult read_request(asio::ip::tcp::socket &sock, std::size_t max_body,
                        http::Request &req) {
  asio::streambuf buf(kMaxHeaderBytes);
  asio::error_code ec;
  std::size_t n = asio::read_until(sock, buf, "\r\n\r\n", ec);
  if (ec) {
    if (ec == asio::error::eof && buf.size() == 0)
      return ReadResult::Closed;
    return ReadResult::Malformed;
  }

  auto data = buf.data();
  std::string head(asio::buffers_begin(data),
                   asio::buffers_begin(data) + static_cast<std::ptrdiff_t>(n));
  buf.consume(n);

  std::istringstream hs(head);
  std::string line;
  std::getline(hs, line);
  strip_cr(line);
  std::istringstream rl(line);
  std::string url, proto;
  rl >> req.method >> url >> proto;
  if (req.method.empty() || url.empty() || proto.rfind("HTTP/", 0) != 0)
    return ReadResult::Malformed;

  size_t qpos = url.find('?');
  if (qpos == std::string::npos)
    req.path = url;
  else {
    req.path = url.substr(0, qpos);
    req.query = url.substr(qpos + 1);
  }

  while (std::getline(hs, line)) {
    strip_cr(line);
    if (line.empty())
      break;
    size_t col = line.find(':');
    if (col == std::string::npos)
      return ReadResult::Malformed;
    std::string k = http::to_lower(line.substr(0, col));
    std::string v = line.substr(col + 1);
    auto b = v.find_first_not_of(" \t");
    auto e = v.find_last_not_of(" \t");
    req.headers[k] = b == std::string::npos ? "" : v.substr(b, e - b + 1);
  }

  if (req.headers.count("transfer-encoding"))
    return ReadResult::Malformed;

  auto it = req.headers.find("content-length");
  if (it == req.headers.end())
    return ReadResult::Ok;
  std::size_t len = 0;
  if (!parse_length(it->second, len))
    return ReadResult::Malformed;
  if (len > max_body)
    return ReadResult::TooLarge;

  // grow with the bytes that actually arrive, not the declared length
  auto data_after = buf.data();
  std::size_t have = std::min(len, buf.size());
  req.body.assign(asio::buffers_begin(data_after),
                  asio::buffers_begin(data_after) +
                      static_cast<std::ptrdiff_t>(have));
  char chunk[kBodyChunk];
  while (req.body.size() < len) {
    std::size_t want = std::min(kBodyChunk, len - req.body.size());
    std::size_t got = sock.read_some(asio::buffer(chunk, want), ec);
    if (ec)
      return ReadResult::Malformed;
    req.body.append(chunk, got);
  }
  return ReadResult::Ok;
}

void write_response(asio::ip::tcp::socket &sock, const http::Response &resp) {
  std::ostringstream ss;
  ss << "HTTP/1.1 " << resp.status << " " << http::reason_phrase(resp.status)
     << "\r\n";
  bool has_ct = resp.headers.find("Content-Type") != resp.headers.end();
  for (auto &kv : resp.headers)
    ss << kv.first << ": " << kv.second << "\r\n";
  if (!has_ct)
    ss << "Content-Type: text/plain\r\n";
  ss << "Content-Length: " << resp.body.size() << "\r\n";
  ss << "Connection: close\r\n\r\n";
  ss << resp.body;
  auto s = ss.str();
  asio::error_code ec;
  asio::write(sock, asio::buffer(s.data(), s.size()), ec);
  if (ec)
    spdlog::debug("[http] write failed: {}", ec.message());
}

} // namespace

struct Server::Impl {
  asio::io_context io;
  asio::ip::tcp::acceptor acc;
  asio::signal_set signals;
  Handler handler;
  std::size_t max_body;
  std::chrono::milliseconds read_timeout;
  std::atomic<bool> stopping{false};
  std::mutex live_m;
  std::set<std::shared_ptr<Conn>> live;
  ThreadPool pool;

  Impl(const std::string &addr, unsigned short port, Handler h,
       unsigned threads, std::size_t max_body_bytes,
       std::chrono::milliseconds timeout)
      : io(),
        acc(io, asio::ip::tcp::endpoint(asio::ip::make_address(addr), port)),
        signals(io), handler(std::move(h)), max_body(max_body_bytes),
        read_timeout(timeout), pool(threads) {}

  void accept_next() {
    acc.async_accept([this](const asio::error_code &ec,
                            asio::ip::tcp::socket sock) {
      if (ec == asio::error::operation_aborted || stopping.load())
        return;
      if (ec) {
        spdlog::warn("[http] accept failed: {}", ec.message());
      } else {
        auto c = std::make_shared<Conn>(std::move(sock), io);
        {
          std::lock_guard<std::mutex> lk(live_m);
          live.insert(c);
        }
        c->deadline.expires_after(read_timeout);
        c->deadline.async_wait([this, c](const asio::error_code &tec) {
          if (!tec)
            expire(c);
        });
        pool.submit([this, c] { serve(c); });
      }
      accept_next();
    });
  }

  void serve(const std::shared_ptr<Conn> &c) {
    try {
      serve_one(*c);
    } catch (const std::exception &e) {
      spdlog::error("[http] connection failed: {}", e.what());
    }
    asio::post(io, [c] { c->deadline.cancel(); });
    // the socket is closed under the lock so expire() and close_all() never
    // touch a descriptor that may already be reused
    std::lock_guard<std::mutex> lk(live_m);
    live.erase(c);
    asio::error_code ec;
    c->sock.shutdown(asio::ip::tcp::socket::shutdown_both, ec);
    c->sock.close(ec);
  }

  void expire(const std::shared_ptr<Conn> &c) {
    std::lock_guard<std::mutex> lk(live_m);
    if (!live.count(c))
      return;
    c->expired = true;
    c->close_read();
  }

  void serve_one(Conn &c) {
    http::Request req;
    http::Response resp;
    ReadResult rr = read_request(c.sock, max_body, req);
    if (rr != ReadResult::Ok && c.expired.load()) {
      spdlog::debug("[http] read deadline passed");
      resp = http::error_response(408, "request timed out");
    } else {
      switch (rr) {
      case ReadResult::Closed:
        return;
      case ReadResult::Malformed:
        resp = http::error_response(400, "malformed request");
        break;
      case ReadResult::TooLarge:
        resp = http::error_response(413, "request body too large");
        break;
      case ReadResult::Ok:
        try {
          resp = handler(req);
        } catch (const std::exception &e) {
          spdlog::error("[http] {} {} failed: {}", req.method, req.path,
                        e.what());
          resp = http::error_response(500, "internal error");
        }
        break;
      }
    }
    spdlog::debug("[http] {} {} -> {}", req.method, req.path, resp.status);
    write_response(c.sock, resp);
  }

  // io thread only
  void close_all() {
    asio::error_code ec;
    acc.close(ec);
    signals.cancel(ec);
    std::lock_guard<std::mutex> lk(live_m);
    for (auto &c : live) {
      c->deadline.cancel();
      c->close_read();
    }
  }
};

Server::Server(const std::string &addr, unsigned short port, Handler h,
               unsigned threads, std::size_t max_body_bytes,
               std::chrono::milliseconds read_timeout)
    : impl_(std::make_unique<Impl>(addr, port, std::move(h), threads,
                                   max_body_bytes, read_timeout)) {}

Server::~Server() = default;

unsigned short Server::port() const {
  return impl_->acc.local_endpoint().port();
}

void Server::stop_on_signals() {
  impl_->signals.add(SIGINT);
  impl_->signals.add(SIGTERM);
  impl_->signals.async_wait([this](const asio::error_code &ec, int sig) {
    if (ec)
      return;
    spdlog::info("[http] signal {} received, stopping", sig);
    stop();
  });
}

void Server::run() {
  auto ep = impl_->acc.local_endpoint();
  spdlog::info("[http] listening on {}:{} ({} workers)",
               ep.address().to_string(), ep.port(), impl_->pool.size());
  impl_->accept_next();
  impl_->io.run();
  impl_->pool.wait_idle();
  spdlog::info("[http] stopped");
}

void Server::stop() {
  if (impl_->stopping.exchange(true))
    return;
  asio::post(impl_->io, [impl = impl_.get()] { impl->close_all(); });
}

} // namespace pipedag
