#include <pipedag/app.hpp>

int main(int argc, char **argv) { return pipedag::App{}.run(argc, argv); }
