#ifndef REQTRACE_TEST_SUPPORT_TEMPORARY_PROJECT_H
#define REQTRACE_TEST_SUPPORT_TEMPORARY_PROJECT_H

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>

namespace reqtrace {
namespace test {

class TemporaryProject {
public:
  TemporaryProject() {
    static std::atomic<int> counter{0};
    const auto timestamp =
        std::chrono::steady_clock::now().time_since_epoch().count();
    root_ = std::filesystem::temp_directory_path() /
            ("reqtrace-project-" + std::to_string(timestamp) + "-" +
             std::to_string(counter++));
    std::filesystem::create_directories(root_);
  }

  ~TemporaryProject() {
    std::error_code error;
    std::filesystem::remove_all(root_, error);
  }

  std::filesystem::path AddFile(const std::filesystem::path &relative,
                                const std::string &content = "") const {
    const auto full_path = root_ / relative;
    std::filesystem::create_directories(full_path.parent_path());
    std::ofstream stream(full_path, std::ios::binary | std::ios::trunc);
    stream << content;
    return full_path;
  }

  const std::filesystem::path &root() const { return root_; }

private:
  std::filesystem::path root_;
};

} // namespace test
} // namespace reqtrace

#endif // REQTRACE_TEST_SUPPORT_TEMPORARY_PROJECT_H
