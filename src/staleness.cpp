#include <reqtrace/staleness.h>

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <iomanip>
#include <sstream>
#include <utility>

namespace reqtrace {
namespace {

constexpr std::uint64_t kFnvOffsetBasis = 0xcbf29ce484222325ULL;
constexpr std::uint64_t kFnvPrime = 0x100000001b3ULL;
constexpr std::size_t kMinCapturedDigits = 8;
constexpr std::size_t kFingerprintDigits = 16;

void CollectStale(const std::vector<Reference> &references,
                  const RuleCoverage &coverage,
                  std::vector<StaleReference> &stale) {
  for (const auto &reference : references) {
    if (!reference.captured_fingerprint) {
      continue;
    }
    const auto matches = std::any_of(
        coverage.declarations.begin(), coverage.declarations.end(),
        [&](const Rule &rule) {
          return FingerprintMatches(*reference.captured_fingerprint,
                                    rule.fingerprint);
        });
    if (!matches) {
      stale.push_back({reference, coverage.declarations.front().fingerprint});
    }
  }
}

} // namespace

std::string NormalizeRuleText(const std::string &text) {
  std::string normalized;
  normalized.reserve(text.size());
  bool pending_space = false;
  for (const auto character : text) {
    if (std::isspace(static_cast<unsigned char>(character)) != 0) {
      pending_space = !normalized.empty();
      continue;
    }
    if (pending_space) {
      normalized.push_back(' ');
      pending_space = false;
    }
    normalized.push_back(character);
  }
  return normalized;
}

std::string Fingerprint(const std::string &text) {
  std::uint64_t hash = kFnvOffsetBasis;
  for (const auto byte : NormalizeRuleText(text)) {
    hash ^= static_cast<unsigned char>(byte);
    hash *= kFnvPrime;
  }
  std::ostringstream stream;
  stream << std::hex << std::setw(static_cast<int>(kFingerprintDigits))
         << std::setfill('0') << hash;
  return stream.str();
}

bool IsValidCapturedFingerprint(const std::string &captured) {
  if (captured.size() < kMinCapturedDigits ||
      captured.size() > kFingerprintDigits) {
    return false;
  }
  return std::all_of(captured.begin(), captured.end(), [](char character) {
    return std::isxdigit(static_cast<unsigned char>(character)) != 0;
  });
}

bool FingerprintMatches(const std::string &captured,
                        const std::string &current) {
  if (!IsValidCapturedFingerprint(captured) ||
      captured.size() > current.size()) {
    return false;
  }
  return std::equal(captured.begin(), captured.end(), current.begin(),
                    [](char left, char right) {
                      return std::tolower(static_cast<unsigned char>(left)) ==
                             std::tolower(static_cast<unsigned char>(right));
                    });
}

StalenessTracker::StalenessTracker(std::shared_ptr<Logger> logger)
    : logger_(EnsureLogger(std::move(logger))) {}

void StalenessTracker::Track(IndexSnapshot &snapshot) const {
  snapshot.stale.clear();
  for (const auto &[spec_name, spec] : snapshot.forward) {
    for (const auto &[rule_id, coverage] : spec.rules) {
      if (coverage.declarations.empty()) {
        continue;
      }
      CollectStale(coverage.impl_refs, coverage, snapshot.stale);
      CollectStale(coverage.verify_refs, coverage, snapshot.stale);
      CollectStale(coverage.depends_refs, coverage, snapshot.stale);
      CollectStale(coverage.related_refs, coverage, snapshot.stale);
    }
  }
  logger_->Log(LogLevel::kDebug, "staleness.complete",
               {{"stale", std::to_string(snapshot.stale.size())}});
}

} // namespace reqtrace
