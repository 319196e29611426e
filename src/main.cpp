#include "recollect/cli/commands.hpp"

int main(int argc, char **argv) { return recollect::cli::run_cli(argc, argv); }
