#include <reqtrace/errors.h>
#include <reqtrace/reload_controller.h>

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <thread>
#include <vector>

namespace reqtrace {
namespace {

// Builds a snapshot tagged with the build number; can hold a build open or
// fail on demand.
class StubPipeline : public IndexPipeline {
public:
  IndexSnapshot Build(const TraceConfig &config) override {
    const auto build = ++builds_;
    {
      std::unique_lock<std::mutex> lock(mutex_);
      started_ = true;
      started_cv_.notify_all();
      release_cv_.wait(lock, [this]() { return !hold_; });
    }
    const auto fail_from = fail_from_.load();
    if (fail_.load() || (fail_from > 0 && build >= fail_from)) {
      throw RebuildError("disk went away");
    }
    IndexSnapshot snapshot;
    snapshot.config = config;
    for (int i = 0; i < 3; ++i) {
      snapshot.pairings.push_back(
          {"build-" + std::to_string(build), "impl", {}, {}});
    }
    return snapshot;
  }

  void Hold() {
    std::lock_guard<std::mutex> lock(mutex_);
    hold_ = true;
    started_ = false;
  }

  void WaitUntilStarted() {
    std::unique_lock<std::mutex> lock(mutex_);
    started_cv_.wait(lock, [this]() { return started_; });
  }

  void Release() {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      hold_ = false;
    }
    release_cv_.notify_all();
  }

  void Fail(bool fail) { fail_.store(fail); }
  // Builds numbered build and later fail; 0 turns this off.
  void FailFromBuild(int build) { fail_from_.store(build); }
  int Builds() const { return builds_.load(); }

private:
  std::atomic<int> builds_{0};
  std::atomic<bool> fail_{false};
  std::atomic<int> fail_from_{0};
  std::mutex mutex_;
  std::condition_variable started_cv_;
  std::condition_variable release_cv_;
  bool hold_ = false;
  bool started_ = false;
};

TraceConfig SampleConfig() {
  TraceConfig config;
  config.root_path = "/project";
  return config;
}

TEST(ReloadControllerTest, StartsWithAnEmptyVersionZeroSnapshot) {
  ReloadController controller(SampleConfig(),
                              std::make_unique<StubPipeline>());

  const auto snapshot = controller.Current();
  ASSERT_NE(snapshot, nullptr);
  EXPECT_EQ(snapshot->version, 0u);
  EXPECT_TRUE(snapshot->pairings.empty());
  EXPECT_EQ(controller.Version(), 0u);
}

TEST(ReloadControllerTest, EachReloadPublishesTheNextVersion) {
  ReloadController controller(SampleConfig(),
                              std::make_unique<StubPipeline>());

  EXPECT_EQ(controller.Reload(), 1u);
  EXPECT_EQ(controller.Reload(), 2u);
  EXPECT_EQ(controller.Current()->version, 2u);
  EXPECT_EQ(controller.Current()->pairings.front().spec, "build-2");
  EXPECT_EQ(controller.Current()->config.root_path, "/project");
}

TEST(ReloadControllerTest, FailedRebuildKeepsThePreviousSnapshot) {
  auto pipeline = std::make_unique<StubPipeline>();
  auto *stub = pipeline.get();
  ReloadController controller(SampleConfig(), std::move(pipeline));
  controller.Reload();
  const auto before = controller.Current();

  stub->Fail(true);
  EXPECT_THROW(controller.Reload(), RebuildError);
  EXPECT_EQ(controller.Current(), before);
  EXPECT_EQ(controller.Version(), 1u);

  stub->Fail(false);
  EXPECT_EQ(controller.Reload(), 2u);
}

TEST(ReloadControllerTest, ConfigProviderErrorsAreReportedAsFailures) {
  int calls = 0;
  ReloadController controller(
      [&calls]() -> TraceConfig {
        if (++calls > 1) {
          throw ConfigError("bad config");
        }
        return SampleConfig();
      },
      std::make_unique<StubPipeline>());

  EXPECT_EQ(controller.Reload(), 1u);
  EXPECT_THROW(controller.Reload(), ConfigError);
  EXPECT_EQ(controller.Current()->version, 1u);
}

TEST(ReloadControllerTest, RejectsMissingCollaborators) {
  EXPECT_THROW(ReloadController(SampleConfig(), nullptr),
               std::invalid_argument);
  EXPECT_THROW(ReloadController(ReloadController::ConfigProvider(),
                                std::make_unique<StubPipeline>()),
               std::invalid_argument);
}

TEST(ReloadControllerTest, ConcurrentRequestsCoalesceIntoOneRebuild) {
  auto pipeline = std::make_unique<StubPipeline>();
  auto *stub = pipeline.get();
  ReloadController controller(SampleConfig(), std::move(pipeline));

  stub->Hold();
  std::thread first([&controller]() { controller.Reload(); });
  stub->WaitUntilStarted();

  constexpr int kWaiters = 4;
  std::vector<std::uint64_t> versions(kWaiters, 0);
  std::vector<std::thread> waiters;
  for (int i = 0; i < kWaiters; ++i) {
    waiters.emplace_back(
        [&controller, &versions, i]() { versions[i] = controller.Reload(); });
  }
  // The held build's own ticket plus every queued waiter.
  while (controller.PendingRequests() < kWaiters + 1) {
    std::this_thread::yield();
  }
  stub->Release();

  first.join();
  for (auto &waiter : waiters) {
    waiter.join();
  }

  // Requests made during the first build are served by one follow-up.
  EXPECT_EQ(stub->Builds(), 2);
  EXPECT_EQ(controller.Version(), static_cast<std::uint64_t>(stub->Builds()));
  for (const auto version : versions) {
    EXPECT_EQ(version, 2u);
  }
}

TEST(ReloadControllerTest, WaitersShareTheOutcomeOfTheBuildThatCoveredThem) {
  auto pipeline = std::make_unique<StubPipeline>();
  auto *stub = pipeline.get();
  ReloadController controller(SampleConfig(), std::move(pipeline));

  stub->FailFromBuild(2);
  stub->Hold();
  std::thread first([&controller]() { EXPECT_EQ(controller.Reload(), 1u); });
  stub->WaitUntilStarted();

  constexpr int kWaiters = 3;
  std::atomic<int> failures{0};
  std::vector<std::thread> waiters;
  for (int i = 0; i < kWaiters; ++i) {
    waiters.emplace_back([&controller, &failures]() {
      try {
        controller.Reload();
      } catch (const RebuildError &) {
        ++failures;
      }
    });
  }
  while (controller.PendingRequests() < kWaiters + 1) {
    std::this_thread::yield();
  }
  stub->Release();

  first.join();
  for (auto &waiter : waiters) {
    waiter.join();
  }

  // The held build succeeds for its caller; the follow-up fails once and
  // every queued waiter sees that failure.
  EXPECT_EQ(stub->Builds(), 2);
  EXPECT_EQ(failures.load(), kWaiters);
  EXPECT_EQ(controller.PendingRequests(), 0u);

  stub->FailFromBuild(0);
  EXPECT_EQ(controller.Reload(), 2u);
}

TEST(ReloadControllerTest, NonStandardExceptionsDoNotWedgeLaterReloads) {
  int calls = 0;
  ReloadController controller(
      [&calls]() -> TraceConfig {
        if (++calls == 1) {
          throw 42;
        }
        return SampleConfig();
      },
      std::make_unique<StubPipeline>());

  EXPECT_THROW(controller.Reload(), int);
  EXPECT_EQ(controller.Version(), 0u);
  EXPECT_EQ(controller.Reload(), 1u);
}

TEST(ReloadControllerTest, ReadersNeverObserveAPartialSnapshot) {
  ReloadController controller(SampleConfig(),
                              std::make_unique<StubPipeline>());
  controller.Reload();

  std::atomic<bool> done{false};
  std::atomic<int> torn{0};
  std::thread reader([&]() {
    while (!done.load()) {
      const auto snapshot = controller.Current();
      if (snapshot->pairings.size() != 3 ||
          snapshot->pairings.front().spec !=
              "build-" + std::to_string(snapshot->version)) {
        ++torn;
      }
    }
  });
  for (int i = 0; i < 20; ++i) {
    controller.Reload();
  }
  done.store(true);
  reader.join();

  EXPECT_EQ(torn.load(), 0);
  EXPECT_EQ(controller.Version(), 21u);
}

} // namespace
} // namespace reqtrace
