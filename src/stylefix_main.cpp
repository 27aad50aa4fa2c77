#include <stylefix/cli_exit_codes.h>
#include <stylefix/stylefix_cli.h>

#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace {
void PrintGlobalUsage() {
  std::cout << "Usage: stylefix <command> [options]\n\n"
            << "Commands:\n"
            << "  check   Report style diagnostics (default if no command is "
               "given).\n"
            << "  fix     Apply automatic fixes and save changed files.\n\n"
            << "Run 'stylefix check --help' for options.\n";
}
} // namespace

int main(int argc, char **argv) {
  try {
    const std::vector<std::string> arguments(argv + 1, argv + argc);

    if (!arguments.empty() &&
        (arguments.front() == "--help" || arguments.front() == "-h")) {
      PrintGlobalUsage();
      return stylefix::kExitClean;
    }

    std::string command = "check";
    std::size_t first_argument_index = 0;
    if (!arguments.empty() && arguments.front().rfind('-', 0) != 0) {
      command = arguments.front();
      first_argument_index = 1;
    }

    const std::vector<std::string> command_arguments(
        arguments.begin() + static_cast<std::ptrdiff_t>(first_argument_index),
        arguments.end());
    if (command == "check") {
      return stylefix::RunCommand(stylefix::RunMode::kCheck, command_arguments,
                                  std::cout);
    }
    if (command == "fix") {
      return stylefix::RunCommand(stylefix::RunMode::kFix, command_arguments,
                                  std::cout);
    }

    throw std::invalid_argument("Unknown command: " + command);
  } catch (const std::exception &ex) {
    std::cerr << "Error: " << ex.what() << "\n";
    PrintGlobalUsage();
    return stylefix::kExitFailure;
  }
}
