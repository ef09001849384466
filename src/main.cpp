#include "voxrelay/cli/commands.hpp"

int main(int argc, char **argv) { return voxrelay::cli::run_cli(argc, argv); }
