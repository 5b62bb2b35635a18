#include <reqtrace/escaping.h>

#include <cstdio>

namespace reqtrace {

std::string EscapeJsonString(const std::string &value) {
  std::string escaped;
  escaped.reserve(value.size());
  for (const auto character : value) {
    switch (character) {
    case '"':
      escaped.append("\\\"");
      continue;
    case '\\':
      escaped.append("\\\\");
      continue;
    case '\n':
      escaped.append("\\n");
      continue;
    case '\r':
      escaped.append("\\r");
      continue;
    case '\t':
      escaped.append("\\t");
      continue;
    default:
      break;
    }
    if (static_cast<unsigned char>(character) < 0x20) {
      char buffer[8];
      std::snprintf(buffer, sizeof(buffer), "\\u%04x",
                    static_cast<unsigned>(static_cast<unsigned char>(character)));
      escaped.append(buffer);
      continue;
    }
    escaped.push_back(character);
  }
  return escaped;
}

std::string EscapeMarkdownCell(const std::string &value) {
  std::string escaped;
  escaped.reserve(value.size());
  for (const auto character : value) {
    if (character == '|') {
      escaped.append("\\|");
    } else if (character == '\n') {
      escaped.append("<br>");
    } else if (character != '\r') {
      escaped.push_back(character);
    }
  }
  return escaped;
}

std::string JoinStrings(const std::vector<std::string> &values,
                        const std::string &delimiter) {
  std::string joined;
  for (std::size_t i = 0; i < values.size(); ++i) {
    if (i > 0) {
      joined += delimiter;
    }
    joined += values[i];
  }
  return joined;
}

} // namespace reqtrace
