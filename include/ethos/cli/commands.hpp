#pragma once

#include <iosfwd>
#include <string>
#include <vector>

namespace ethos::cli {

constexpr int EXIT_OK = 0;
constexpr int EXIT_FAILURE_RESULT = 1;
constexpr int EXIT_USAGE = 2;

[[nodiscard]] std::string version_string();
void print_help(std::ostream &out);

/// Runs one command. `args` excludes the program name.
int run_command(std::vector<std::string> args, std::ostream &out, std::ostream &err);

int run_cli(int argc, char **argv);

} // namespace ethos::cli
