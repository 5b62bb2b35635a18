#pragma once

#include <reqtrace/comment_styles.h>
#include <reqtrace/models.h>

#include <optional>
#include <vector>

namespace reqtrace {

// Lexical code-unit detection for one language family. Returned units use
// 1-based inclusive line numbers and either nest or are disjoint.
class UnitLocator {
public:
  virtual ~UnitLocator() = default;
  virtual std::vector<CodeUnit> Locate(const LexedSource &source) const = 0;
};

// C-like languages: units are brace-delimited blocks whose header looks like
// a function, type or named block. Control-flow blocks are not units.
class BraceUnitLocator : public UnitLocator {
public:
  std::vector<CodeUnit> Locate(const LexedSource &source) const override;
};

// Python-like languages: def/class headers, ended by dedent.
class IndentUnitLocator : public UnitLocator {
public:
  std::vector<CodeUnit> Locate(const LexedSource &source) const override;
};

// Detects nothing; every annotation falls back to a synthesized line unit.
class SingleLineUnitLocator : public UnitLocator {
public:
  std::vector<CodeUnit> Locate(const LexedSource &) const override {
    return {};
  }
};

// Index of the smallest unit containing line; the later start wins a tie.
std::optional<std::size_t> InnermostUnit(const std::vector<CodeUnit> &units,
                                         std::size_t line);

} // namespace reqtrace
