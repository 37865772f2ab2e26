#pragma once
#include <pipedag/config.hpp>
#include <pipedag/http.hpp>

#include <string>
#include <vector>

namespace pipedag {

// Stateless after construction; safe to call handle() from many threads.
class Router {
public:
  explicit Router(const Config &cfg);
  http::Response handle(const http::Request &r) const;

private:
  std::vector<std::string> origins_;
  Traversal traversal_;

  bool origin_allowed(const std::string &origin) const;
  http::Response handle_root() const;
  http::Response handle_parse(const std::string &body) const;
  http::Response handle_preflight(const http::Request &r) const;
  void add_cors(const http::Request &r, http::Response &resp) const;
};

} // namespace pipedag
