#pragma once

#include <reqtrace/models.h>

#include <vector>

namespace reqtrace {

constexpr int kExitSuccess = 0;
constexpr int kExitError = 1;
constexpr int kExitFindings = 2;
constexpr int kExitNotFound = 3;

int FindingsExitCode(const std::vector<Finding> &findings);

} // namespace reqtrace
