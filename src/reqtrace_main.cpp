#include <reqtrace/cli.h>
#include <reqtrace/cli_exit_codes.h>
#include <reqtrace/errors.h>

#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

int main(int argc, char **argv) {
  try {
    const std::vector<std::string> arguments(argv + 1, argv + argc);
    const auto options = reqtrace::ParseQueryArguments(arguments);
    return reqtrace::RunCommand(options, std::cout);
  } catch (const reqtrace::NotFoundError &ex) {
    std::cerr << "Error: " << ex.what() << "\n";
    return reqtrace::kExitNotFound;
  } catch (const reqtrace::ConfigError &ex) {
    std::cerr << "Error: " << ex.what() << "\n";
    return reqtrace::kExitError;
  } catch (const std::exception &ex) {
    std::cerr << "Error: " << ex.what() << "\n";
    reqtrace::PrintUsage(std::cerr);
    return reqtrace::kExitError;
  }
}
