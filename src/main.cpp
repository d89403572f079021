#include "tgassist/cli/commands.hpp"

int main(int argc, char **argv) { return tgassist::cli::run_cli(argc, argv); }
