#include "ethos/cli/commands.hpp"

int main(int argc, char **argv) { return ethos::cli::run_cli(argc, argv); }
