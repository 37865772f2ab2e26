#pragma once
#include <pipedag/graph.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace pipedag {

// upper bound accepted for max_body_bytes
constexpr std::size_t kMaxBodyCeiling = std::size_t{1} << 30;

struct Config {
  std::string addr = "127.0.0.1";
  unsigned short port = 8000;
  unsigned threads = 0;
  std::vector<std::string> allowed_origins{"http://localhost:3000",
                                           "http://127.0.0.1:3000"};
  std::size_t max_body_bytes = 8 * 1024 * 1024;
  // a connection must deliver its whole request within this window
  unsigned read_timeout_ms = 10000;
  std::string log_level = "info";
  Traversal traversal = Traversal::Iterative;
};

// PIPEDAG_ADDR, PIPEDAG_PORT, PIPEDAG_THREADS, PIPEDAG_ORIGINS,
// PIPEDAG_MAX_BODY, PIPEDAG_READ_TIMEOUT_MS, PIPEDAG_LOG_LEVEL
bool apply_env(Config &cfg, std::string *err);

bool set_port(Config &cfg, const std::string &v, std::string *err);
bool set_threads(Config &cfg, const std::string &v, std::string *err);
bool set_max_body(Config &cfg, const std::string &v, std::string *err);
bool set_read_timeout(Config &cfg, const std::string &v, std::string *err);
bool set_log_level(Config &cfg, const std::string &v, std::string *err);

std::vector<std::string> split_list(const std::string &s, char sep = ',');

} // namespace pipedag
