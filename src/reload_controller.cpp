#include <reqtrace/reload_controller.h>

#include <stdexcept>
#include <utility>

namespace reqtrace {

ReloadController::ReloadController(TraceConfig config,
                                   std::unique_ptr<IndexPipeline> pipeline,
                                   std::shared_ptr<Logger> logger)
    : ReloadController(ConfigProvider([config]() { return config; }),
                       std::move(pipeline), std::move(logger)) {}

ReloadController::ReloadController(ConfigProvider provider,
                                   std::unique_ptr<IndexPipeline> pipeline,
                                   std::shared_ptr<Logger> logger)
    : provider_(std::move(provider)), pipeline_(std::move(pipeline)),
      logger_(EnsureLogger(std::move(logger))),
      snapshot_(std::make_shared<const IndexSnapshot>()) {
  if (!provider_) {
    throw std::invalid_argument("ReloadController requires a config provider");
  }
  if (!pipeline_) {
    throw std::invalid_argument("ReloadController requires a pipeline");
  }
}

std::shared_ptr<const IndexSnapshot> ReloadController::Current() const {
  std::shared_lock<std::shared_mutex> lock(snapshot_mutex_);
  return snapshot_;
}

std::uint64_t ReloadController::Reload() {
  std::unique_lock<std::mutex> lock(reload_mutex_);
  const auto ticket = ++requested_;
  logger_->Log(LogLevel::kDebug, "reload.requested",
               {{"ticket", std::to_string(ticket)},
                {"rebuilding", rebuilding_ ? "true" : "false"}});

  while (completed_for_ < ticket) {
    if (!rebuilding_) {
      RebuildLocked(lock);
      continue;
    }
    reload_done_.wait(lock);
  }

  // The first rebuild whose range reaches this ticket is the one that
  // covered it; later rebuilds may already have finished.
  const auto found = outcomes_.lower_bound(ticket);
  const auto version = found->second.version;
  const auto error = found->second.error;
  if (--found->second.uncollected == 0) {
    outcomes_.erase(found);
  }
  if (error) {
    std::rethrow_exception(error);
  }
  return version;
}

std::uint64_t ReloadController::PendingRequests() const {
  std::lock_guard<std::mutex> lock(reload_mutex_);
  return requested_ - completed_for_;
}

void ReloadController::RebuildLocked(std::unique_lock<std::mutex> &lock) {
  rebuilding_ = true;
  const auto first = completed_for_ + 1;
  const auto covers = requested_;
  lock.unlock();

  std::exception_ptr error;
  std::uint64_t published = 0;
  try {
    auto snapshot = pipeline_->Build(provider_());
    published = version_.load() + 1;
    snapshot.version = published;
    auto shared = std::make_shared<const IndexSnapshot>(std::move(snapshot));
    {
      std::unique_lock<std::shared_mutex> swap_lock(snapshot_mutex_);
      snapshot_ = std::move(shared);
      version_.store(published);
    }
    logger_->Log(LogLevel::kInfo, "reload.complete",
                 {{"version", std::to_string(published)},
                  {"covers", std::to_string(covers)}});
  } catch (const std::exception &failure) {
    logger_->Log(LogLevel::kError, "rebuild.failed",
                 {{"reason", failure.what()},
                  {"version", std::to_string(version_.load())}});
    error = std::current_exception();
  } catch (...) {
    // Handed to every covered caller, which rethrows it.
    logger_->Log(LogLevel::kError, "rebuild.failed",
                 {{"reason", "unknown exception"},
                  {"version", std::to_string(version_.load())}});
    error = std::current_exception();
  }

  lock.lock();
  rebuilding_ = false;
  completed_for_ = covers;
  Outcome outcome;
  outcome.version = error ? version_.load() : published;
  outcome.error = error;
  outcome.uncollected = covers - first + 1;
  outcomes_[covers] = outcome;
  reload_done_.notify_all();
}

} // namespace reqtrace
