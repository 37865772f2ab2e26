#include <pipedag/app.hpp>
#include <pipedag/pipeline.hpp>
#include <pipedag/router.hpp>
#include <pipedag/server.hpp>

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <spdlog/spdlog.h>

#include <fstream>
#include <iostream>
#include <iterator>
#include <sstream>
#include <string>
#include <type_traits>

#ifndef PIPEDAG_VERSION
#define PIPEDAG_VERSION "unknown"
#endif

namespace pipedag {

static void print_help() {
  std::cout <<
      R"(pipedag - pipeline DAG validation service

Usage:
  pipedag serve [--addr A] [--port P] [--threads N] [--origin URL]...
                [--max-body BYTES] [--read-timeout MS] [--log-level LEVEL]
                [--recursive]
  pipedag check <file.json|-> [--recursive] [--quiet]
  pipedag version

Environment:
  PIPEDAG_ADDR PIPEDAG_PORT PIPEDAG_THREADS PIPEDAG_ORIGINS
  PIPEDAG_MAX_BODY PIPEDAG_READ_TIMEOUT_MS PIPEDAG_LOG_LEVEL
)";
}

static bool read_all(const std::string &path, std::istream &in,
                     std::string &out, std::string *err) {
  if (path == "-") {
    out.assign(std::istreambuf_iterator<char>(in),
               std::istreambuf_iterator<char>());
    return true;
  }
  std::ifstream f(path, std::ios::binary);
  if (!f.is_open()) {
    if (err)
      *err = "cannot open " + path;
    return false;
  }
  std::ostringstream ss;
  ss << f.rdbuf();
  out = ss.str();
  return true;
}

int run_check(const CmdCheck &c, std::istream &in, std::ostream &out) {
  std::string body, err;
  if (!read_all(c.path, in, body, &err)) {
    spdlog::error("[check] {}", err);
    return 2;
  }
  ParseError perr;
  auto p = parse_pipeline(body, &perr);
  if (!p) {
    spdlog::error("[check] {}: {}", c.path, perr.str());
    return 2;
  }
  auto s = summarize(*p, c.traversal);
  if (!c.quiet)
    out << summary_to_json(s) << "\n";
  spdlog::debug("[check] {} traversal={} dag={}", c.path,
                traversal_name(c.traversal), s.is_dag);
  return s.is_dag ? 0 : 1;
}

int run_serve(const Config &cfg) {
  spdlog::set_level(spdlog::level::from_str(cfg.log_level));
  spdlog::info("[serve] addr={} port={} threads={} origins={} traversal={}",
               cfg.addr, cfg.port, cfg.threads,
               fmt::join(cfg.allowed_origins, ","),
               traversal_name(cfg.traversal));
  Router router(cfg);
  try {
    Server srv(
        cfg.addr, cfg.port,
        [&router](const http::Request &r) { return router.handle(r); },
        cfg.threads, cfg.max_body_bytes,
        std::chrono::milliseconds(cfg.read_timeout_ms));
    srv.stop_on_signals();
    srv.run();
  } catch (const std::exception &e) {
    spdlog::error("[serve] {}", e.what());
    return 1;
  }
  return 0;
}

int App::run(int argc, char **argv) {
  spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");

  Config base;
  std::string err;
  if (!apply_env(base, &err)) {
    spdlog::error("{}", err);
    return 2;
  }
  spdlog::set_level(spdlog::level::from_str(base.log_level));

  auto pr = parse_cli(argc, argv, base);
  if (!pr.cmd) {
    if (!pr.error.empty())
      spdlog::error("{}", pr.error);
    print_help();
    return pr.error.empty() ? 0 : 2;
  }

  return std::visit(
      [&](auto &&c) -> int {
        using T = std::decay_t<decltype(c)>;

        if constexpr (std::is_same_v<T, CmdHelp>) {
          print_help();
          return 0;

        } else if constexpr (std::is_same_v<T, CmdVersion>) {
          std::cout << fmt::format("pipedag {}\n", PIPEDAG_VERSION);
          return 0;

        } else if constexpr (std::is_same_v<T, CmdCheck>) {
          return run_check(c, std::cin, std::cout);

        } else {
          return run_serve(c.cfg);
        }
      },
      *pr.cmd);
}

} // namespace pipedag
