#include <reqtrace/index_pipeline.h>

#include <reqtrace/annotation_scanner.h>
#include <reqtrace/index_builder.h>
#include <reqtrace/pattern_resolver.h>
#include <reqtrace/spec_parser.h>
#include <reqtrace/staleness.h>
#include <reqtrace/validator.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <exception>
#include <filesystem>
#include <iterator>
#include <map>
#include <mutex>
#include <set>
#include <thread>
#include <utility>
#include <vector>

namespace reqtrace {
namespace {

// Scans files on a fixed pool; the first failure stops the remaining work
// and is rethrown once every worker has joined.
class ParallelScan {
public:
  ParallelScan(const AnnotationScanner &scanner, SourceReader &reader,
               std::filesystem::path root, std::vector<std::string> files)
      : scanner_(scanner), reader_(reader), root_(std::move(root)),
        files_(std::move(files)), results_(files_.size()) {}

  void Start(std::size_t worker_count) {
    const auto count = std::max<std::size_t>(
        1, std::min(worker_count, files_.size()));
    for (std::size_t i = 0; i < count && !files_.empty(); ++i) {
      workers_.emplace_back([this]() { Work(); });
    }
  }

  void Join() {
    for (auto &worker : workers_) {
      if (worker.joinable()) {
        worker.join();
      }
    }
    workers_.clear();
  }

  std::map<std::string, ScannedFile> Collect() {
    Join();
    if (error_) {
      std::rethrow_exception(error_);
    }
    std::map<std::string, ScannedFile> scanned;
    for (std::size_t i = 0; i < files_.size(); ++i) {
      scanned.emplace(files_[i], std::move(results_[i]));
    }
    return scanned;
  }

  ~ParallelScan() { Join(); }

private:
  void Work() {
    while (!failed_.load()) {
      const auto index = next_.fetch_add(1);
      if (index >= files_.size()) {
        return;
      }
      try {
        const auto content = reader_.Read(root_ / files_[index]);
        results_[index] = scanner_.Scan(files_[index], content);
      } catch (...) {
        std::lock_guard<std::mutex> lock(error_mutex_);
        if (!error_) {
          error_ = std::current_exception();
        }
        failed_.store(true);
        return;
      }
    }
  }

  const AnnotationScanner &scanner_;
  SourceReader &reader_;
  std::filesystem::path root_;
  std::vector<std::string> files_;
  std::vector<ScannedFile> results_;
  std::vector<std::thread> workers_;
  std::atomic<std::size_t> next_{0};
  std::atomic<bool> failed_{false};
  std::mutex error_mutex_;
  std::exception_ptr error_;
};

std::map<std::string, std::vector<Rule>>
ParseSpecs(const std::vector<ResolvedSpec> &specs,
           const std::filesystem::path &root, SourceReader &reader) {
  std::map<std::string, std::vector<Rule>> rules;
  for (const auto &spec : specs) {
    const SpecParser parser(spec.prefix);
    auto &declarations = rules[spec.name];
    for (const auto &document : spec.documents) {
      auto parsed = parser.Parse(document, reader.Read(root / document));
      std::move(parsed.begin(), parsed.end(),
                std::back_inserter(declarations));
    }
  }
  return rules;
}

long long ElapsedMs(std::chrono::steady_clock::time_point start) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             std::chrono::steady_clock::now() - start)
      .count();
}

} // namespace

DefaultIndexPipeline::DefaultIndexPipeline(PipelineComponents components,
                                           const ComponentRegistry &registry)
    : lister_(std::move(components.lister)),
      reader_(components.reader ? std::move(components.reader)
                                : std::make_shared<DiskSourceReader>()),
      logger_(EnsureLogger(std::move(components.logger))),
      worker_count_(components.worker_count), registry_(&registry) {}

IndexSnapshot DefaultIndexPipeline::Build(const TraceConfig &config) {
  logger_->Log(LogLevel::kInfo, "rebuild.start",
               {{"root", config.root_path},
                {"specs", std::to_string(config.specs.size())}});
  const auto rebuild_start = std::chrono::steady_clock::now();

  BuildInputs inputs;
  inputs.resolution = PatternResolver(lister_, logger_).Resolve(config);
  logger_->Log(
      LogLevel::kDebug, "rebuild.stage.complete",
      {{"stage", "resolve"},
       {"specs", std::to_string(inputs.resolution.specs.size())},
       {"pairings", std::to_string(inputs.resolution.pairings.size())}});

  std::set<std::string> source_files;
  for (const auto &pairing : inputs.resolution.pairings) {
    source_files.insert(pairing.files.begin(), pairing.files.end());
  }

  const auto root = std::filesystem::weakly_canonical(config.root_path);
  const AnnotationScanner scanner(CommentStyleTable(config.languages),
                                  *registry_);
  const auto workers =
      worker_count_ != 0
          ? worker_count_
          : std::max<std::size_t>(1, std::thread::hardware_concurrency());

  ParallelScan scan(scanner, *reader_, root,
                    {source_files.begin(), source_files.end()});
  scan.Start(workers);
  // Spec documents are parsed on this thread while the workers scan.
  inputs.rules = ParseSpecs(inputs.resolution.specs, root, *reader_);
  std::size_t rule_count = 0;
  for (const auto &entry : inputs.rules) {
    rule_count += entry.second.size();
  }
  logger_->Log(LogLevel::kDebug, "rebuild.stage.complete",
               {{"stage", "parse"}, {"rules", std::to_string(rule_count)}});

  inputs.files = scan.Collect();
  logger_->Log(LogLevel::kDebug, "rebuild.stage.complete",
               {{"stage", "scan"},
                {"files", std::to_string(inputs.files.size())},
                {"workers", std::to_string(workers)}});

  auto snapshot = IndexBuilder(logger_).Build(config, std::move(inputs));
  StalenessTracker(logger_).Track(snapshot);
  Validator(logger_).Validate(snapshot);

  logger_->Log(LogLevel::kInfo, "rebuild.complete",
               {{"duration_ms", std::to_string(ElapsedMs(rebuild_start))},
                {"files", std::to_string(snapshot.reverse.size())},
                {"findings", std::to_string(snapshot.findings.size())}});
  return snapshot;
}

IndexPipelineBuilder::IndexPipelineBuilder(const ComponentRegistry &registry)
    : registry_(&registry) {}

IndexPipelineBuilder &
IndexPipelineBuilder::WithFileLister(std::shared_ptr<FileLister> lister) {
  components_.lister = std::move(lister);
  return *this;
}

IndexPipelineBuilder &
IndexPipelineBuilder::WithSourceReader(std::shared_ptr<SourceReader> reader) {
  components_.reader = std::move(reader);
  return *this;
}

IndexPipelineBuilder &
IndexPipelineBuilder::WithLogger(std::shared_ptr<Logger> logger) {
  components_.logger = std::move(logger);
  return *this;
}

IndexPipelineBuilder &
IndexPipelineBuilder::WithWorkerCount(std::size_t worker_count) {
  components_.worker_count = worker_count;
  return *this;
}

std::unique_ptr<DefaultIndexPipeline> IndexPipelineBuilder::Build() {
  components_.logger = EnsureLogger(std::move(components_.logger));
  if (!components_.lister) {
    components_.lister = std::make_shared<DiskFileLister>();
  }
  return std::make_unique<DefaultIndexPipeline>(std::move(components_),
                                                *registry_);
}

} // namespace reqtrace
