#include "clawwatch/cli/commands.hpp"

int main(int argc, char **argv) { return clawwatch::cli::run_cli(argc, argv); }
