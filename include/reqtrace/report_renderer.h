#pragma once

#include <reqtrace/query_service.h>

#include <string>
#include <vector>

namespace reqtrace {

// Renders query results for a front-end. Implementations are stateless.
class ReportRenderer {
public:
  virtual ~ReportRenderer() = default;
  virtual std::string RenderStatus(const StatusReport &status) const = 0;
  virtual std::string RenderRules(const std::string &title,
                                  const std::vector<RuleSummary> &rules) const = 0;
  virtual std::string
  RenderStale(const std::vector<StaleReference> &stale) const = 0;
  virtual std::string RenderUnmapped(const UnmappedReport &report) const = 0;
  virtual std::string
  RenderRuleDetails(const std::vector<RuleReport> &rules) const = 0;
  virtual std::string
  RenderFindings(const std::vector<Finding> &findings) const = 0;
  virtual std::string
  RenderSearch(const std::vector<SearchHit> &hits) const = 0;
  virtual std::string RenderConfig(const ConfigSummary &summary) const = 0;
};

class MarkdownReportRenderer : public ReportRenderer {
public:
  std::string RenderStatus(const StatusReport &status) const override;
  std::string RenderRules(const std::string &title,
                          const std::vector<RuleSummary> &rules) const override;
  std::string RenderStale(const std::vector<StaleReference> &stale) const override;
  std::string RenderUnmapped(const UnmappedReport &report) const override;
  std::string
  RenderRuleDetails(const std::vector<RuleReport> &rules) const override;
  std::string RenderFindings(const std::vector<Finding> &findings) const override;
  std::string RenderSearch(const std::vector<SearchHit> &hits) const override;
  std::string RenderConfig(const ConfigSummary &summary) const override;
};

class JsonReportRenderer : public ReportRenderer {
public:
  std::string RenderStatus(const StatusReport &status) const override;
  std::string RenderRules(const std::string &title,
                          const std::vector<RuleSummary> &rules) const override;
  std::string RenderStale(const std::vector<StaleReference> &stale) const override;
  std::string RenderUnmapped(const UnmappedReport &report) const override;
  std::string
  RenderRuleDetails(const std::vector<RuleReport> &rules) const override;
  std::string RenderFindings(const std::vector<Finding> &findings) const override;
  std::string RenderSearch(const std::vector<SearchHit> &hits) const override;
  std::string RenderConfig(const ConfigSummary &summary) const override;
};

} // namespace reqtrace
