#include <reqtrace/cli_exit_codes.h>

namespace reqtrace {

int FindingsExitCode(const std::vector<Finding> &findings) {
  return findings.empty() ? kExitSuccess : kExitFindings;
}

} // namespace reqtrace
