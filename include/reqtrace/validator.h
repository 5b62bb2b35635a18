#pragma once

#include <reqtrace/logging.h>
#include <reqtrace/models.h>

#include <memory>
#include <vector>

namespace reqtrace {

// Turns the builder's unresolved references, annotation problems, duplicate
// declarations and stale references into findings. Findings already on the
// snapshot (configuration problems) are kept.
class Validator {
public:
  explicit Validator(std::shared_ptr<Logger> logger = nullptr);

  void Validate(IndexSnapshot &snapshot) const;

private:
  std::shared_ptr<Logger> logger_;
};

// Orders by kind, spec, rule id, first site, then message.
void SortFindings(std::vector<Finding> &findings);

} // namespace reqtrace
