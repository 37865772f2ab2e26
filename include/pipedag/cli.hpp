#pragma once
#include <pipedag/config.hpp>

#include <optional>
#include <string>
#include <variant>

namespace pipedag {

struct CmdServe {
  Config cfg;
};

struct CmdCheck {
  std::string path;
  Traversal traversal = Traversal::Iterative;
  bool quiet = false;
};

struct CmdHelp {};
struct CmdVersion {};

using Command = std::variant<CmdServe, CmdCheck, CmdHelp, CmdVersion>;

struct ParseResult {
  std::optional<Command> cmd;
  std::string error;
};

// `base` carries defaults plus environment overrides; flags win over both.
ParseResult parse_cli(int argc, char **argv, const Config &base);

} // namespace pipedag
