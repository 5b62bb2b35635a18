#pragma once

#include <reqtrace/interfaces.h>
#include <reqtrace/logging.h>
#include <reqtrace/models.h>

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <exception>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <shared_mutex>

namespace reqtrace {

// Owns the process-wide index snapshot. Readers copy the current snapshot
// pointer and never see a partial build. Rebuilds are serialized: requests
// that arrive while one runs wait for the next rebuild, which covers all of
// them. The version grows by one per published snapshot.
class ReloadController {
public:
  // Called at the start of every rebuild; may throw ConfigError.
  using ConfigProvider = std::function<TraceConfig()>;

  ReloadController(TraceConfig config, std::unique_ptr<IndexPipeline> pipeline,
                   std::shared_ptr<Logger> logger = nullptr);
  ReloadController(ConfigProvider provider,
                   std::unique_ptr<IndexPipeline> pipeline,
                   std::shared_ptr<Logger> logger = nullptr);

  ReloadController(const ReloadController &) = delete;
  ReloadController &operator=(const ReloadController &) = delete;

  // Never null; version 0 is the empty snapshot before the first build.
  std::shared_ptr<const IndexSnapshot> Current() const;
  std::uint64_t Version() const { return version_.load(); }

  // Full rebuild; returns the version that covers this request. Rethrows
  // the rebuild's failure, in which case the previous snapshot stays live.
  std::uint64_t Reload();

  // Reload calls that are waiting for a rebuild to cover them.
  std::uint64_t PendingRequests() const;

private:
  void RebuildLocked(std::unique_lock<std::mutex> &lock);

  ConfigProvider provider_;
  std::unique_ptr<IndexPipeline> pipeline_;
  std::shared_ptr<Logger> logger_;

  mutable std::shared_mutex snapshot_mutex_;
  std::shared_ptr<const IndexSnapshot> snapshot_;
  std::atomic<std::uint64_t> version_{0};

  mutable std::mutex reload_mutex_;
  std::condition_variable reload_done_;
  bool rebuilding_ = false;
  std::uint64_t requested_ = 0;
  // Highest request ticket covered by a finished rebuild.
  std::uint64_t completed_for_ = 0;

  // Result of one finished rebuild, kept until every ticket it covered has
  // collected it.
  struct Outcome {
    std::uint64_t version = 0;
    std::exception_ptr error;
    std::uint64_t uncollected = 0;
  };
  // Keyed by the last ticket each rebuild covered.
  std::map<std::uint64_t, Outcome> outcomes_;
};

} // namespace reqtrace
