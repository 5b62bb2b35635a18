#include <reqtrace/unit_locator.h>

#include <algorithm>
#include <cctype>
#include <set>
#include <string>
#include <utility>

namespace reqtrace {
namespace {

struct HeaderShape {
  UnitKind kind = UnitKind::kBlock;
  std::optional<std::string> name;
};

const std::set<std::string> &ControlKeywords() {
  static const std::set<std::string> keywords = {
      "if",    "else",  "for",    "while",   "do",      "switch",
      "try",   "catch", "finally", "match",  "loop",    "return",
      "case",  "default", "with", "lock",    "synchronized",
      "foreach", "unsafe", "select", "defer", "go",     "async",
      "await", "using", "fixed",  "checked", "unchecked"};
  return keywords;
}

const std::set<std::string> &ContainerKeywords() {
  static const std::set<std::string> keywords = {"namespace", "extern",
                                                 "mod", "package"};
  return keywords;
}

const std::set<std::string> &TypeKeywords() {
  static const std::set<std::string> keywords = {
      "class",  "struct", "enum",     "union",    "interface", "trait",
      "impl",   "record", "object",   "protocol", "extension"};
  return keywords;
}

const std::set<std::string> &FunctionKeywords() {
  static const std::set<std::string> keywords = {"func", "function", "fn",
                                                 "fun", "def"};
  return keywords;
}

bool IsIdentifierChar(char character) {
  return std::isalnum(static_cast<unsigned char>(character)) != 0 ||
         character == '_' || character == '$';
}

std::string Trim(const std::string &value) {
  const auto first = value.find_first_not_of(" \t");
  if (first == std::string::npos) {
    return "";
  }
  const auto last = value.find_last_not_of(" \t");
  return value.substr(first, last - first + 1);
}

std::vector<std::string> Words(const std::string &text) {
  std::vector<std::string> words;
  std::string current;
  for (const auto character : text) {
    if (IsIdentifierChar(character)) {
      current.push_back(character);
    } else if (!current.empty()) {
      words.push_back(std::move(current));
      current.clear();
    }
  }
  if (!current.empty()) {
    words.push_back(std::move(current));
  }
  return words;
}

// Removes the bracketed group starting at position (which holds open).
std::size_t SkipGroup(const std::string &text, std::size_t position,
                      char open, char close) {
  int depth = 0;
  for (; position < text.size(); ++position) {
    if (text[position] == open) {
      ++depth;
    } else if (text[position] == close && --depth == 0) {
      return position + 1;
    }
  }
  return text.size();
}

// Drops leading attributes and decorations: #[..], [[..]], @Name(..),
// template<..>.
std::string StripAttributes(std::string header) {
  while (true) {
    header = Trim(header);
    if (header.rfind("#[", 0) == 0 || header.rfind("#![", 0) == 0) {
      header = header.substr(SkipGroup(header, header.find('['), '[', ']'));
    } else if (header.rfind("[[", 0) == 0) {
      header = header.substr(SkipGroup(header, 0, '[', ']'));
    } else if (header.rfind('@', 0) == 0) {
      std::size_t end = 1;
      while (end < header.size() &&
             (IsIdentifierChar(header[end]) || header[end] == '.')) {
        ++end;
      }
      if (end < header.size() && header[end] == '(') {
        end = SkipGroup(header, end, '(', ')');
      }
      header = header.substr(end);
    } else if (header.rfind("template", 0) == 0 &&
               header.find('<') != std::string::npos &&
               Trim(header.substr(8, header.find('<') - 8)).empty()) {
      header = header.substr(SkipGroup(header, header.find('<'), '<', '>'));
    } else {
      return header;
    }
  }
}

bool HasTopLevelAssignment(const std::string &header) {
  if (header.find("=>") != std::string::npos) {
    return true;
  }
  if (header.find("operator") != std::string::npos) {
    return false;
  }
  int depth = 0;
  for (std::size_t i = 0; i < header.size(); ++i) {
    const auto character = header[i];
    if (character == '(' || character == '[' || character == '<') {
      ++depth;
    } else if (character == ')' || character == ']' || character == '>') {
      depth = std::max(0, depth - 1);
    } else if (character == '=' && depth == 0) {
      const auto previous = i > 0 ? header[i - 1] : ' ';
      const auto next = i + 1 < header.size() ? header[i + 1] : ' ';
      if (next != '=' && previous != '=' && previous != '!' &&
          previous != '<' && previous != '>') {
        return true;
      }
    }
  }
  return false;
}

// Word immediately before position, allowing qualified names (a::b, a.b).
std::string NameBefore(const std::string &header, std::size_t position) {
  auto end = position;
  while (end > 0 && std::isspace(static_cast<unsigned char>(header[end - 1]))) {
    --end;
  }
  auto begin = end;
  while (begin > 0) {
    const auto character = header[begin - 1];
    if (IsIdentifierChar(character) || character == ':' || character == '.' ||
        character == '~') {
      --begin;
    } else {
      break;
    }
  }
  return header.substr(begin, end - begin);
}

std::optional<std::string> FunctionName(const std::string &header) {
  int depth = 0;
  for (std::size_t i = 0; i < header.size(); ++i) {
    const auto character = header[i];
    if (character == '(') {
      if (depth == 0) {
        const auto name = NameBefore(header, i);
        if (!name.empty() && FunctionKeywords().count(name) == 0 &&
            std::isdigit(static_cast<unsigned char>(name.front())) == 0) {
          return name;
        }
      }
      ++depth;
    } else if (character == ')') {
      depth = std::max(0, depth - 1);
    }
  }
  return std::nullopt;
}

// nullopt when the block is not a unit (control flow, containers,
// initializers).
std::optional<HeaderShape> ClassifyHeader(const std::string &raw_header) {
  const auto header = StripAttributes(raw_header);
  const auto words = Words(header);
  if (header.empty() || words.empty()) {
    return std::nullopt;
  }
  if (ControlKeywords().count(words.front()) != 0 ||
      ContainerKeywords().count(words.front()) != 0) {
    return std::nullopt;
  }
  if (HasTopLevelAssignment(header)) {
    return std::nullopt;
  }

  const auto paren = header.find('(');
  for (std::size_t i = 0; i < words.size(); ++i) {
    if (TypeKeywords().count(words[i]) == 0) {
      continue;
    }
    const auto keyword_at = header.find(words[i]);
    if (paren != std::string::npos && paren < keyword_at) {
      break;
    }
    HeaderShape shape{UnitKind::kType, std::nullopt};
    if (words[i] == "impl") {
      const auto rest = Trim(header.substr(keyword_at + 4));
      if (!rest.empty()) {
        shape.name = rest;
      }
    } else if (i > 0 && words.front() == "type") {
      shape.name = words[i - 1];
    } else {
      for (std::size_t j = i + 1; j < words.size(); ++j) {
        if (TypeKeywords().count(words[j]) == 0 && words[j] != "final") {
          shape.name = words[j];
          break;
        }
      }
    }
    return shape;
  }

  if (paren != std::string::npos) {
    auto name = FunctionName(header);
    if (!name) {
      return std::nullopt;
    }
    return HeaderShape{UnitKind::kFunction, std::move(name)};
  }
  return HeaderShape{UnitKind::kBlock, words.back()};
}

bool IsAccessLabel(const std::string &header) {
  const auto trimmed = Trim(header);
  return trimmed == "public:" || trimmed == "private:" ||
         trimmed == "protected:";
}

bool IsPreprocessorLine(const LexedLine &line) {
  const auto code = Trim(line.code);
  return !code.empty() && code.front() == '#' && code.rfind("#[", 0) != 0 &&
         code.rfind("#![", 0) != 0;
}

// Pulls unit starts up over the comment block sitting directly above them.
void ExtendOverLeadingComments(const LexedSource &source, CodeUnit &unit,
                               bool include_decorators) {
  while (unit.start_line > 1) {
    const auto &previous = source.lines[unit.start_line - 2];
    const auto code = Trim(previous.code);
    const bool decorator =
        include_decorators && !code.empty() && code.front() == '@';
    if (!previous.IsCommentOnly() && !decorator) {
      break;
    }
    --unit.start_line;
  }
}

struct OpenBrace {
  std::optional<HeaderShape> shape;
  std::size_t start_line = 0;
};

} // namespace

std::vector<CodeUnit> BraceUnitLocator::Locate(const LexedSource &source) const {
  std::vector<CodeUnit> units;
  std::vector<OpenBrace> stack;
  std::string header;
  std::size_t header_line = 0;

  const auto reset_header = [&]() {
    header.clear();
    header_line = 0;
  };

  for (std::size_t index = 0; index < source.lines.size(); ++index) {
    const auto line_number = index + 1;
    const auto &line = source.lines[index];
    if (IsPreprocessorLine(line)) {
      reset_header();
      continue;
    }
    for (const auto character : line.code) {
      switch (character) {
      case '{':
        stack.push_back({ClassifyHeader(header),
                         header_line == 0 ? line_number : header_line});
        reset_header();
        break;
      case '}':
        if (!stack.empty()) {
          auto open = std::move(stack.back());
          stack.pop_back();
          const bool one_line_block =
              open.shape && open.shape->kind == UnitKind::kBlock &&
              open.start_line == line_number;
          if (open.shape && !one_line_block) {
            units.push_back({source.path, open.start_line, line_number,
                             open.shape->kind, open.shape->name, {}});
          }
        }
        reset_header();
        break;
      case ';':
        reset_header();
        break;
      default:
        if (header_line == 0 &&
            std::isspace(static_cast<unsigned char>(character)) == 0) {
          header_line = line_number;
        }
        header.push_back(character);
        if (character == ':' && IsAccessLabel(header)) {
          reset_header();
        }
      }
    }
    header.push_back(' ');
  }

  const auto last_line = std::max<std::size_t>(source.lines.size(), 1);
  for (auto &open : stack) {
    if (open.shape) {
      units.push_back({source.path, open.start_line, last_line,
                       open.shape->kind, open.shape->name, {}});
    }
  }

  for (auto &unit : units) {
    ExtendOverLeadingComments(source, unit, false);
  }
  return units;
}

std::vector<CodeUnit> IndentUnitLocator::Locate(const LexedSource &source) const {
  std::vector<CodeUnit> units;
  const auto &lines = source.lines;

  for (std::size_t index = 0; index < lines.size(); ++index) {
    const auto code = Trim(lines[index].code);
    std::string keyword;
    for (const auto *candidate : {"def ", "async def ", "class "}) {
      if (code.rfind(candidate, 0) == 0) {
        keyword = candidate;
        break;
      }
    }
    if (keyword.empty()) {
      continue;
    }

    CodeUnit unit;
    unit.file = source.path;
    unit.kind = keyword == "class " ? UnitKind::kType : UnitKind::kFunction;
    const auto words = Words(code.substr(keyword.size()));
    if (!words.empty()) {
      unit.name = words.front();
    }
    unit.start_line = index + 1;

    // Signatures may span lines until their parentheses balance.
    auto header_end = index;
    int depth = 0;
    for (auto cursor = index; cursor < lines.size(); ++cursor) {
      for (const auto character : lines[cursor].code) {
        depth += character == '(' || character == '[';
        depth -= character == ')' || character == ']';
      }
      header_end = cursor;
      if (depth <= 0) {
        break;
      }
    }

    unit.end_line = header_end + 1;
    const auto header_indent = lines[index].indent;
    for (auto cursor = header_end + 1; cursor < lines.size(); ++cursor) {
      if (!lines[cursor].HasCode()) {
        continue;
      }
      if (lines[cursor].indent <= header_indent) {
        break;
      }
      unit.end_line = cursor + 1;
    }

    ExtendOverLeadingComments(source, unit, true);
    units.push_back(std::move(unit));
  }
  return units;
}

std::optional<std::size_t> InnermostUnit(const std::vector<CodeUnit> &units,
                                         std::size_t line) {
  std::optional<std::size_t> best;
  for (std::size_t index = 0; index < units.size(); ++index) {
    const auto &unit = units[index];
    if (!unit.Contains(line)) {
      continue;
    }
    if (!best) {
      best = index;
      continue;
    }
    const auto &current = units[*best];
    if (unit.Span() < current.Span() ||
        (unit.Span() == current.Span() &&
         unit.start_line > current.start_line)) {
      best = index;
    }
  }
  return best;
}

} // namespace reqtrace
