#include <reqtrace/comment_styles.h>

#include <reqtrace/errors.h>

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <utility>

namespace reqtrace {
namespace {

constexpr std::size_t kTabWidth = 4;

const std::map<std::string, CommentStyle> &Families() {
  static const std::map<std::string, CommentStyle> families = {
      {"c", {"c", {"//"}, "/*", "*/", "brace", false}},
      {"script", {"script", {"//"}, "/*", "*/", "brace", true}},
      {"shell", {"shell", {"#"}, "", "", "brace", true}},
      {"hash", {"hash", {"#"}, "", "", "indent", true}},
      {"dash", {"dash", {"--"}, "", "", "line", true}},
      {"semicolon", {"semicolon", {";"}, "", "", "line", false}},
      {"markup", {"markup", {}, "<!--", "-->", "line", false}}};
  return families;
}

const std::map<std::string, std::string> &DefaultExtensions() {
  static const std::map<std::string, std::string> extensions = {
      {".c", "c"},        {".h", "c"},         {".cc", "c"},
      {".cpp", "c"},      {".cxx", "c"},       {".hh", "c"},
      {".hpp", "c"},      {".hxx", "c"},       {".ixx", "c"},
      {".rs", "c"},       {".go", "c"},        {".java", "c"},
      {".js", "script"},  {".jsx", "script"},  {".mjs", "script"},
      {".cjs", "script"}, {".ts", "script"},   {".tsx", "script"},
      {".dart", "script"}, {".cs", "c"},       {".swift", "c"},
      {".kt", "c"},       {".kts", "c"},       {".scala", "c"},
      {".zig", "c"},
      {".proto", "c"},    {".css", "c"},       {".sh", "shell"},
      {".bash", "shell"}, {".zsh", "shell"},   {".py", "hash"},
      {".rb", "hash"},    {".pl", "hash"},     {".r", "hash"},
      {".yaml", "hash"},  {".yml", "hash"},    {".toml", "hash"},
      {".cmake", "hash"}, {".ex", "hash"},     {".exs", "hash"},
      {".nim", "hash"},   {".sql", "dash"},    {".lua", "dash"},
      {".hs", "dash"},    {".elm", "dash"},    {".ada", "dash"},
      {".lisp", "semicolon"}, {".el", "semicolon"}, {".clj", "semicolon"},
      {".scm", "semicolon"},  {".asm", "semicolon"}, {".html", "markup"},
      {".htm", "markup"}, {".xml", "markup"},  {".svg", "markup"}};
  return extensions;
}

std::string NormalizeExtension(std::string extension) {
  std::transform(
      extension.begin(), extension.end(), extension.begin(),
      [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  if (!extension.empty() && extension.front() != '.') {
    extension.insert(extension.begin(), '.');
  }
  return extension;
}

bool StartsWithAt(const std::string &text, std::size_t position,
                  const std::string &token) {
  return !token.empty() && text.compare(position, token.size(), token) == 0;
}

// Skips a C-style char literal ('x' or '\n'); returns 0 when the quote is
// something else, such as a Rust lifetime.
std::size_t CharLiteralLength(const std::string &line, std::size_t position) {
  if (position + 3 < line.size() && line[position + 1] == '\\' &&
      line[position + 3] == '\'') {
    return 4;
  }
  if (position + 2 < line.size() && line[position + 2] == '\'' &&
      line[position + 1] != '\\') {
    return 3;
  }
  return 0;
}

std::size_t MeasureIndent(const std::string &line) {
  std::size_t indent = 0;
  for (const auto character : line) {
    if (character == ' ') {
      ++indent;
    } else if (character == '\t') {
      indent += kTabWidth;
    } else {
      break;
    }
  }
  return indent;
}

} // namespace

CommentStyle CommentFamily(const std::string &name) {
  const auto &families = Families();
  const auto found = families.find(name);
  if (found == families.end()) {
    std::string known;
    for (const auto &family : CommentFamilyNames()) {
      known += known.empty() ? family : ", " + family;
    }
    throw ConfigError("Unknown comment family '" + name +
                      "'. Known families: " + known);
  }
  return found->second;
}

std::vector<std::string> CommentFamilyNames() {
  std::vector<std::string> names;
  for (const auto &entry : Families()) {
    names.push_back(entry.first);
  }
  return names;
}

CommentStyleTable::CommentStyleTable() : fallback_(CommentFamily("c")) {
  for (const auto &[extension, family] : DefaultExtensions()) {
    by_extension_[extension] = CommentFamily(family);
  }
}

CommentStyleTable::CommentStyleTable(
    const std::map<std::string, std::string> &overrides)
    : CommentStyleTable() {
  for (const auto &[extension, family] : overrides) {
    Assign(extension, family);
  }
}

void CommentStyleTable::Assign(const std::string &extension,
                               const std::string &family) {
  by_extension_[NormalizeExtension(extension)] = CommentFamily(family);
}

const CommentStyle &CommentStyleTable::ForPath(const std::string &path) const {
  const auto extension =
      NormalizeExtension(std::filesystem::path(path).extension().string());
  const auto found = by_extension_.find(extension);
  return found == by_extension_.end() ? fallback_ : found->second;
}

bool LexedLine::IsBlank() const {
  return std::all_of(raw.begin(), raw.end(), [](unsigned char character) {
    return std::isspace(character) != 0;
  });
}

bool LexedLine::HasCode() const {
  return std::any_of(code.begin(), code.end(), [](unsigned char character) {
    return std::isspace(character) == 0;
  });
}

LexedSource LexSource(const std::string &path, const std::string &content,
                      const CommentStyle &style) {
  LexedSource source{path, {}};
  bool in_block = false;

  std::size_t line_start = 0;
  while (line_start <= content.size()) {
    auto line_end = content.find('\n', line_start);
    if (line_end == std::string::npos) {
      line_end = content.size();
      if (line_start == line_end) {
        break;
      }
    }
    LexedLine line;
    line.raw = content.substr(line_start, line_end - line_start);
    if (!line.raw.empty() && line.raw.back() == '\r') {
      line.raw.pop_back();
    }
    line.indent = MeasureIndent(line.raw);

    const auto &raw = line.raw;
    std::string block_text;
    char quote = 0;
    std::size_t position = 0;
    while (position < raw.size()) {
      if (in_block) {
        const auto close = raw.find(style.block_close, position);
        if (close == std::string::npos) {
          block_text.append(raw, position, std::string::npos);
          position = raw.size();
          break;
        }
        block_text.append(raw, position, close - position);
        line.comments.push_back(std::move(block_text));
        block_text.clear();
        position = close + style.block_close.size();
        in_block = false;
        continue;
      }

      const auto character = raw[position];
      if (quote != 0) {
        if (character == '\\') {
          position += 2;
          continue;
        }
        if (character == quote) {
          line.code.push_back(character);
          quote = 0;
        }
        ++position;
        continue;
      }

      const auto marker = std::find_if(
          style.line_markers.begin(), style.line_markers.end(),
          [&](const std::string &token) {
            return StartsWithAt(raw, position, token);
          });
      if (marker != style.line_markers.end()) {
        line.comments.push_back(raw.substr(position + marker->size()));
        position = raw.size();
        break;
      }
      if (StartsWithAt(raw, position, style.block_open)) {
        in_block = true;
        position += style.block_open.size();
        continue;
      }
      if (character == '"' ||
          (character == '\'' && style.single_quote_strings)) {
        quote = character;
        line.code.push_back(character);
        ++position;
        continue;
      }
      if (character == '\'') {
        if (const auto length = CharLiteralLength(raw, position); length > 0) {
          line.code.append("''");
          position += length;
          continue;
        }
      }
      line.code.push_back(character);
      ++position;
    }
    if (in_block) {
      line.comments.push_back(std::move(block_text));
    }

    source.lines.push_back(std::move(line));
    if (line_end == content.size()) {
      break;
    }
    line_start = line_end + 1;
  }
  return source;
}

} // namespace reqtrace
