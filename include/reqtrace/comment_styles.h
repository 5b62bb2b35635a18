#pragma once

#include <map>
#include <string>
#include <vector>

namespace reqtrace {

struct CommentStyle {
  std::string family;
  std::vector<std::string> line_markers;
  std::string block_open;
  std::string block_close;
  // Name of the unit locator strategy used for this family.
  std::string locator;
  bool single_quote_strings = false;
};

// Built-in families: c, script, shell, hash, dash, semicolon, markup.
CommentStyle CommentFamily(const std::string &name);
std::vector<std::string> CommentFamilyNames();

class CommentStyleTable {
public:
  CommentStyleTable();
  // Overrides map extensions (".src", leading dot optional) to family names.
  explicit CommentStyleTable(
      const std::map<std::string, std::string> &overrides);

  void Assign(const std::string &extension, const std::string &family);
  // Unknown extensions fall back to the c family.
  const CommentStyle &ForPath(const std::string &path) const;

private:
  std::map<std::string, CommentStyle> by_extension_;
  CommentStyle fallback_;
};

struct LexedLine {
  std::string raw;
  // Code with comments removed and string/char literal contents dropped.
  std::string code;
  std::vector<std::string> comments;
  std::size_t indent = 0;

  bool IsBlank() const;
  bool HasCode() const;
  bool IsCommentOnly() const { return !HasCode() && !comments.empty(); }
};

struct LexedSource {
  std::string path;
  std::vector<LexedLine> lines;
};

LexedSource LexSource(const std::string &path, const std::string &content,
                      const CommentStyle &style);

} // namespace reqtrace
