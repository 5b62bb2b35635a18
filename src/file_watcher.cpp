#include <reqtrace/file_watcher.h>

#include <reqtrace/glob.h>
#include <reqtrace/pattern_resolver.h>

#include <exception>
#include <system_error>
#include <utility>
#include <vector>

namespace reqtrace {
namespace {

std::vector<GlobPattern> CompileGlobs(const std::vector<std::string> &raw) {
  std::vector<GlobPattern> patterns;
  patterns.reserve(raw.size());
  for (const auto &pattern : raw) {
    patterns.emplace_back(pattern);
  }
  return patterns;
}

struct ImplGlobs {
  std::vector<GlobPattern> include;
  std::vector<GlobPattern> exclude;
};

bool Stat(const std::filesystem::path &path, std::uintmax_t &size,
          std::filesystem::file_time_type &modified) {
  std::error_code error;
  modified = std::filesystem::last_write_time(path, error);
  if (error) {
    return false;
  }
  size = std::filesystem::file_size(path, error);
  return !error;
}

} // namespace

FileWatcher::FileWatcher(ReloadController &controller,
                         std::filesystem::path root, Options options,
                         std::shared_ptr<Logger> logger,
                         std::shared_ptr<FileLister> lister)
    : controller_(&controller), root_(std::move(root)), options_(options),
      logger_(EnsureLogger(std::move(logger))),
      lister_(lister ? std::move(lister)
                     : std::make_shared<DiskFileLister>()) {
  last_state_ = Capture();
}

FileWatcher::~FileWatcher() { Stop(); }

void FileWatcher::Start() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (thread_.joinable()) {
    return;
  }
  stopping_ = false;
  thread_ = std::thread([this]() { Run(); });
  logger_->Log(LogLevel::kInfo, "watcher.start",
               {{"root", root_.string()},
                {"poll_ms", std::to_string(options_.poll_interval.count())},
                {"debounce_ms", std::to_string(options_.debounce.count())}});
}

void FileWatcher::Stop() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    stopping_ = true;
  }
  wake_.notify_all();
  if (thread_.joinable()) {
    thread_.join();
    logger_->Log(LogLevel::kInfo, "watcher.stop", {});
  }
}

std::set<std::string>
FileWatcher::WatchedFiles(const IndexSnapshot &snapshot) const {
  std::set<std::string> watched;
  for (const auto &entry : snapshot.forward) {
    watched.insert(entry.second.documents.begin(),
                   entry.second.documents.end());
  }
  for (const auto &pairing : snapshot.pairings) {
    watched.insert(pairing.files.begin(), pairing.files.end());
    watched.insert(pairing.test_files.begin(), pairing.test_files.end());
  }

  std::vector<GlobPattern> documents;
  std::vector<ImplGlobs> impls;
  for (const auto &spec : snapshot.config.specs) {
    for (auto &pattern : CompileGlobs(spec.include)) {
      documents.push_back(std::move(pattern));
    }
    for (const auto &impl : spec.impls) {
      ImplGlobs globs;
      globs.include = CompileGlobs(impl.include);
      for (auto &pattern : CompileGlobs(impl.test_include)) {
        globs.include.push_back(std::move(pattern));
      }
      globs.exclude = CompileGlobs(impl.exclude);
      impls.push_back(std::move(globs));
    }
  }
  if (documents.empty() && impls.empty()) {
    return watched;
  }

  // Files created since the last build only show up through the globs.
  for (const auto &file : lister_->ListFiles(root_)) {
    if (watched.count(file) != 0) {
      continue;
    }
    bool selected = MatchesAny(documents, file);
    for (const auto &impl : impls) {
      if (selected) {
        break;
      }
      selected =
          MatchesAny(impl.include, file) && !MatchesAny(impl.exclude, file);
    }
    if (selected) {
      watched.insert(file);
    }
  }
  return watched;
}

FileWatcher::TreeState FileWatcher::Capture() const {
  TreeState state;
  const auto snapshot = controller_->Current();
  for (const auto &file : WatchedFiles(*snapshot)) {
    FileState file_state;
    if (!Stat(root_ / file, file_state.size, file_state.modified)) {
      // Removed between listing and stat; the next poll sees it gone.
      continue;
    }
    state.emplace(file, file_state);
  }
  if (!options_.config_file.empty()) {
    FileState file_state;
    // Keyed by the absolute path so it never collides with a project file.
    const auto config_path = std::filesystem::absolute(options_.config_file);
    if (Stat(config_path, file_state.size, file_state.modified)) {
      state.emplace(config_path.generic_string(), file_state);
    }
  }
  return state;
}

bool FileWatcher::DetectChanges() {
  auto state = Capture();
  if (state == last_state_) {
    return false;
  }
  logger_->Log(LogLevel::kDebug, "watcher.change",
               {{"files", std::to_string(state.size())},
                {"previous", std::to_string(last_state_.size())}});
  last_state_ = std::move(state);
  pending_since_ = std::chrono::steady_clock::now();
  return true;
}

bool FileWatcher::ReloadIfSettled(std::chrono::steady_clock::time_point now) {
  if (!pending_since_ || now - *pending_since_ < options_.debounce) {
    return false;
  }
  pending_since_.reset();
  try {
    const auto version = controller_->Reload();
    logger_->Log(LogLevel::kInfo, "watcher.reload",
                 {{"version", std::to_string(version)}});
  } catch (const std::exception &error) {
    // The previous snapshot stays live; a later change retries.
    logger_->Log(LogLevel::kError, "watcher.reload.failed",
                 {{"reason", error.what()}});
  }
  return true;
}

void FileWatcher::Run() {
  std::unique_lock<std::mutex> lock(mutex_);
  while (!stopping_) {
    wake_.wait_for(lock, options_.poll_interval,
                   [this]() { return stopping_; });
    if (stopping_) {
      break;
    }
    lock.unlock();
    try {
      DetectChanges();
    } catch (const std::exception &error) {
      logger_->Log(LogLevel::kWarn, "watcher.poll.failed",
                   {{"reason", error.what()}});
    }
    ReloadIfSettled(std::chrono::steady_clock::now());
    lock.lock();
  }
}

} // namespace reqtrace
