#pragma once

#include <reqtrace/component_registry.h>
#include <reqtrace/interfaces.h>
#include <reqtrace/logging.h>

#include <cstddef>
#include <memory>

namespace reqtrace {

class DefaultIndexPipeline;

struct PipelineComponents {
  std::shared_ptr<FileLister> lister;
  std::shared_ptr<SourceReader> reader;
  std::shared_ptr<Logger> logger;
  // Zero picks std::thread::hardware_concurrency().
  std::size_t worker_count = 0;
};

// One rebuild: resolve patterns, parse spec documents while worker threads
// scan source files, merge single-threaded, then track staleness and
// validate. Throws RebuildError on I/O failure; the caller keeps its
// previous snapshot.
class DefaultIndexPipeline : public IndexPipeline {
public:
  DefaultIndexPipeline(PipelineComponents components,
                       const ComponentRegistry &registry);

  IndexSnapshot Build(const TraceConfig &config) override;

private:
  std::shared_ptr<FileLister> lister_;
  std::shared_ptr<SourceReader> reader_;
  std::shared_ptr<Logger> logger_;
  std::size_t worker_count_;
  const ComponentRegistry *registry_;
};

class IndexPipelineBuilder {
public:
  explicit IndexPipelineBuilder(
      const ComponentRegistry &registry = GlobalComponentRegistry());

  IndexPipelineBuilder &WithFileLister(std::shared_ptr<FileLister> lister);
  IndexPipelineBuilder &WithSourceReader(std::shared_ptr<SourceReader> reader);
  IndexPipelineBuilder &WithLogger(std::shared_ptr<Logger> logger);
  IndexPipelineBuilder &WithWorkerCount(std::size_t worker_count);

  std::unique_ptr<DefaultIndexPipeline> Build();

private:
  const ComponentRegistry *registry_;
  PipelineComponents components_;
};

} // namespace reqtrace
