#pragma once
#include <pipedag/cli.hpp>

#include <iosfwd>

namespace pipedag {

class App {
public:
  int run(int argc, char **argv);
};

// Exit codes: 0 acyclic, 1 cyclic, 2 unreadable or invalid input.
int run_check(const CmdCheck &c, std::istream &in, std::ostream &out);
int run_serve(const Config &cfg);

} // namespace pipedag
