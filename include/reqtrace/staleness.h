#pragma once

#include <reqtrace/logging.h>
#include <reqtrace/models.h>

#include <memory>
#include <string>
#include <vector>

namespace reqtrace {

// Collapses whitespace runs to a single space and trims.
std::string NormalizeRuleText(const std::string &text);

// FNV-1a 64 over the normalized text, as 16 lowercase hex digits.
std::string Fingerprint(const std::string &text);

// A captured fingerprint of 8..16 hex digits matches when it is a
// case-insensitive prefix of the current one.
bool FingerprintMatches(const std::string &captured,
                        const std::string &current);

bool IsValidCapturedFingerprint(const std::string &captured);

class StalenessTracker {
public:
  explicit StalenessTracker(std::shared_ptr<Logger> logger = nullptr);

  // Fills snapshot.stale from every reference carrying a fingerprint.
  void Track(IndexSnapshot &snapshot) const;

private:
  std::shared_ptr<Logger> logger_;
};

} // namespace reqtrace
