#pragma once

#include <reqtrace/comment_styles.h>
#include <reqtrace/component_registry.h>
#include <reqtrace/models.h>

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace reqtrace {

// One `prefix[verb? id(@fingerprint)?]` token found in a comment.
struct RawAnnotation {
  std::string prefix;
  // Empty when the token is malformed; see problem.
  std::optional<Verb> verb;
  bool explicit_verb = false;
  std::string rule_id;
  std::optional<std::string> fingerprint;
  std::size_t line = 0;
  std::string problem;
  // Index into ScannedFile::units of the innermost unit holding line.
  std::size_t unit_index = 0;

  bool IsMalformed() const { return !problem.empty(); }
};

// Annotation tokens must open the comment text, after doc-comment
// decoration. Several tokens may follow one another; trailing prose is
// ignored.
std::vector<RawAnnotation> ParseAnnotations(const std::string &comment,
                                            std::size_t line);

struct ScannedFile {
  std::string path;
  std::vector<std::string> lines;
  // Sorted by start line ascending, then end line descending.
  std::vector<CodeUnit> units;
  std::vector<RawAnnotation> annotations;
};

// Thread-safe once constructed: Scan only reads shared state.
class AnnotationScanner {
public:
  explicit AnnotationScanner(
      CommentStyleTable styles = CommentStyleTable(),
      const ComponentRegistry &registry = GlobalComponentRegistry());

  ScannedFile Scan(const std::string &path, const std::string &content) const;

private:
  const UnitLocator &LocatorFor(const CommentStyle &style) const;

  CommentStyleTable styles_;
  std::map<std::string, std::unique_ptr<UnitLocator>> locators_;
  std::string default_locator_;
};

} // namespace reqtrace
