#include "cowork/cli/commands.hpp"

int main(int argc, char **argv) { return cowork::cli::run_cli(argc, argv); }
