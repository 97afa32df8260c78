#include <scribe/cli.h>

#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

constexpr const char *kUsage =
    "Usage: scribe <command> [options]\n\n"
    "Commands:\n"
    "  analyze      Document a repository (default if no command is given).\n"
    "  checkpoints  Manage chunk checkpoints (subcommands: clean).\n\n"
    "Run 'scribe analyze --help' for analysis options.\n";

bool IsFlag(const std::string &argument) {
  return !argument.empty() && argument.front() == '-';
}

int Dispatch(const std::string &command,
             const std::vector<std::string> &arguments) {
  if (command == "analyze") {
    return scribe::RunAnalyze(arguments, std::cout, std::clog);
  }
  if (command == "checkpoints") {
    return scribe::RunCheckpointsCommand(arguments, std::cout);
  }
  throw std::invalid_argument("Unknown command: " + command);
}

} // namespace

int main(int argc, char **argv) {
  std::vector<std::string> arguments(argv + 1, argv + argc);
  try {
    if (!arguments.empty() &&
        (arguments.front() == "--help" || arguments.front() == "-h")) {
      std::cout << kUsage;
      return 0;
    }

    if (arguments.empty() || IsFlag(arguments.front())) {
      return Dispatch("analyze", arguments);
    }
    const std::string command = arguments.front();
    arguments.erase(arguments.begin());
    return Dispatch(command, arguments);
  } catch (const std::exception &ex) {
    std::cerr << "Error: " << ex.what() << "\n" << kUsage;
    return 1;
  }
}
