#pragma once

#include <reqtrace/interfaces.h>
#include <reqtrace/logging.h>
#include <reqtrace/reload_controller.h>

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <thread>

namespace reqtrace {

// Polls the files the current snapshot is built from (spec documents,
// pairing sources, anything newly matching a configured glob, and the
// config file) and asks the controller to reload once changes have settled
// for the debounce interval. Other files under the root are ignored.
class FileWatcher {
public:
  struct Options {
    std::chrono::milliseconds poll_interval{500};
    std::chrono::milliseconds debounce{300};
    // Watched even when it lies outside the root; empty disables it.
    std::filesystem::path config_file;
  };

  FileWatcher(ReloadController &controller, std::filesystem::path root,
              Options options, std::shared_ptr<Logger> logger = nullptr,
              std::shared_ptr<FileLister> lister = nullptr);
  ~FileWatcher();

  FileWatcher(const FileWatcher &) = delete;
  FileWatcher &operator=(const FileWatcher &) = delete;

  void Start();
  void Stop();

  // One poll step: true when a watched file differs from the previous poll.
  bool DetectChanges();
  // Reloads if changes are pending and have been quiet long enough.
  bool ReloadIfSettled(std::chrono::steady_clock::time_point now);

private:
  struct FileState {
    std::filesystem::file_time_type modified;
    std::uintmax_t size = 0;

    bool operator==(const FileState &other) const {
      return modified == other.modified && size == other.size;
    }
  };
  using TreeState = std::map<std::string, FileState>;

  TreeState Capture() const;
  std::set<std::string> WatchedFiles(const IndexSnapshot &snapshot) const;
  void Run();

  ReloadController *controller_;
  std::filesystem::path root_;
  Options options_;
  std::shared_ptr<Logger> logger_;
  std::shared_ptr<FileLister> lister_;

  TreeState last_state_;
  std::optional<std::chrono::steady_clock::time_point> pending_since_;

  std::mutex mutex_;
  std::condition_variable wake_;
  bool stopping_ = false;
  std::thread thread_;
};

} // namespace reqtrace
