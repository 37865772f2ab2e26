#include <pipedag/config.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <cstdlib>
#include <limits>
#include <stdexcept>

namespace pipedag {

static bool parse_number(const std::string &v, unsigned long long max,
                         unsigned long long &out) {
  if (v.empty() || v[0] == '-' || v[0] == '+')
    return false;
  try {
    std::size_t pos = 0;
    out = std::stoull(v, &pos);
    return pos == v.size() && out <= max;
  } catch (const std::invalid_argument &) {
    return false;
  } catch (const std::out_of_range &) {
    return false;
  }
}

bool set_port(Config &cfg, const std::string &v, std::string *err) {
  unsigned long long n = 0;
  if (!parse_number(v, std::numeric_limits<unsigned short>::max(), n)) {
    if (err)
      *err = fmt::format("invalid port: '{}'", v);
    return false;
  }
  cfg.port = static_cast<unsigned short>(n);
  return true;
}

bool set_threads(Config &cfg, const std::string &v, std::string *err) {
  unsigned long long n = 0;
  if (!parse_number(v, 1024, n)) {
    if (err)
      *err = fmt::format("invalid thread count: '{}'", v);
    return false;
  }
  cfg.threads = static_cast<unsigned>(n);
  return true;
}

bool set_max_body(Config &cfg, const std::string &v, std::string *err) {
  unsigned long long n = 0;
  if (!parse_number(v, kMaxBodyCeiling, n) || n == 0) {
    if (err)
      *err = fmt::format("invalid body limit: '{}'", v);
    return false;
  }
  cfg.max_body_bytes = static_cast<std::size_t>(n);
  return true;
}

bool set_read_timeout(Config &cfg, const std::string &v, std::string *err) {
  unsigned long long n = 0;
  if (!parse_number(v, 3600 * 1000, n) || n == 0) {
    if (err)
      *err = fmt::format("invalid read timeout: '{}'", v);
    return false;
  }
  cfg.read_timeout_ms = static_cast<unsigned>(n);
  return true;
}

bool set_log_level(Config &cfg, const std::string &v, std::string *err) {
  // from_str maps unknown names to off
  auto lvl = spdlog::level::from_str(v);
  if (lvl == spdlog::level::off && v != "off") {
    if (err)
      *err = fmt::format("invalid log level: '{}'", v);
    return false;
  }
  cfg.log_level = v;
  return true;
}

std::vector<std::string> split_list(const std::string &s, char sep) {
  std::vector<std::string> out;
  std::size_t pos = 0;
  while (pos <= s.size()) {
    std::size_t next = s.find(sep, pos);
    if (next == std::string::npos)
      next = s.size();
    std::string item = s.substr(pos, next - pos);
    auto b = item.find_first_not_of(" \t");
    auto e = item.find_last_not_of(" \t");
    if (b != std::string::npos)
      out.push_back(item.substr(b, e - b + 1));
    pos = next + 1;
  }
  return out;
}

bool apply_env(Config &cfg, std::string *err) {
  if (const char *e = std::getenv("PIPEDAG_ADDR"))
    cfg.addr = e;
  if (const char *e = std::getenv("PIPEDAG_PORT"))
    if (!set_port(cfg, e, err))
      return false;
  if (const char *e = std::getenv("PIPEDAG_THREADS"))
    if (!set_threads(cfg, e, err))
      return false;
  if (const char *e = std::getenv("PIPEDAG_ORIGINS"))
    cfg.allowed_origins = split_list(e);
  if (const char *e = std::getenv("PIPEDAG_MAX_BODY"))
    if (!set_max_body(cfg, e, err))
      return false;
  if (const char *e = std::getenv("PIPEDAG_READ_TIMEOUT_MS"))
    if (!set_read_timeout(cfg, e, err))
      return false;
  if (const char *e = std::getenv("PIPEDAG_LOG_LEVEL"))
    if (!set_log_level(cfg, e, err))
      return false;
  return true;
}

} // namespace pipedag
