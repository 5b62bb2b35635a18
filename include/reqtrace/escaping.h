#pragma once

#include <string>
#include <vector>

namespace reqtrace {

// JSON string body: quotes, backslashes and control characters escaped.
std::string EscapeJsonString(const std::string &value);

// One markdown table cell: pipes escaped, line breaks as <br>.
std::string EscapeMarkdownCell(const std::string &value);

std::string JoinStrings(const std::vector<std::string> &values,
                        const std::string &delimiter);

} // namespace reqtrace
