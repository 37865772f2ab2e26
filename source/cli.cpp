#include <pipedag/cli.hpp>

#include <string_view>

namespace pipedag {

static bool has_arg(int i, int argc) { return i + 1 < argc; }

static ParseResult parse_serve(int argc, char **argv, const Config &base) {
  ParseResult r{};
  CmdServe c{base};
  bool origins_given = false;
  for (int i = 2; i < argc; i++) {
    std::string_view a = argv[i];
    std::string err;
    bool ok = true;
    if (a == "--recursive") {
      c.cfg.traversal = Traversal::Recursive;
      continue;
    }
    if (!has_arg(i, argc)) {
      r.error = "serve: unknown option or missing value: " + std::string(a);
      return r;
    }
    if (a == "--addr")
      c.cfg.addr = argv[++i];
    else if (a == "--port")
      ok = set_port(c.cfg, argv[++i], &err);
    else if (a == "--threads")
      ok = set_threads(c.cfg, argv[++i], &err);
    else if (a == "--max-body")
      ok = set_max_body(c.cfg, argv[++i], &err);
    else if (a == "--read-timeout")
      ok = set_read_timeout(c.cfg, argv[++i], &err);
    else if (a == "--log-level")
      ok = set_log_level(c.cfg, argv[++i], &err);
    else if (a == "--origin") {
      if (!origins_given)
        c.cfg.allowed_origins.clear();
      origins_given = true;
      c.cfg.allowed_origins.push_back(argv[++i]);
    } else {
      r.error = "serve: unknown option: " + std::string(a);
      return r;
    }
    if (!ok) {
      r.error = "serve: " + err;
      return r;
    }
  }
  r.cmd = c;
  return r;
}

static ParseResult parse_check(int argc, char **argv) {
  ParseResult r{};
  CmdCheck c{};
  for (int i = 2; i < argc; i++) {
    std::string_view a = argv[i];
    if (a == "--recursive")
      c.traversal = Traversal::Recursive;
    else if (a == "--quiet" || a == "-q")
      c.quiet = true;
    else if (a.size() > 1 && a[0] == '-') {
      r.error = "check: unknown option: " + std::string(a);
      return r;
    } else if (c.path.empty())
      c.path = std::string(a);
    else {
      r.error = "check: only one file may be given";
      return r;
    }
  }
  if (c.path.empty()) {
    r.error = "check: file required";
    return r;
  }
  r.cmd = c;
  return r;
}

ParseResult parse_cli(int argc, char **argv, const Config &base) {
  ParseResult r{};
  if (argc < 2) {
    r.cmd = CmdHelp{};
    return r;
  }

  std::string_view cmd = argv[1];
  if (cmd == "--help" || cmd == "-h" || cmd == "help") {
    r.cmd = CmdHelp{};
    return r;
  }
  if (cmd == "--version" || cmd == "version") {
    r.cmd = CmdVersion{};
    return r;
  }
  if (cmd == "serve")
    return parse_serve(argc, argv, base);
  if (cmd == "check")
    return parse_check(argc, argv);

  r.error = "unknown command: " + std::string(cmd);
  return r;
}

} // namespace pipedag
