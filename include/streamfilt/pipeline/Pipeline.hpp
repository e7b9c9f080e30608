#pragma once

#include <cstddef>
#include <memory>

#include "streamfilt/core/PerformanceMetrics.hpp"
#include "streamfilt/core/Transform.hpp"
#include "streamfilt/data/DataSource.hpp"
#include "streamfilt/pipeline/SampleSink.hpp"

namespace streamfilt {

struct PipelineOptions_t {
  // 0 processes the whole source.
  std::size_t maxSamples = 0;
  // Rethrow filter errors instead of skipping the offending sample.
  bool abortOnError = false;
};

// Drives one transform sample-by-sample from a data source into a sink.
class Pipeline {
public:
  Pipeline(std::shared_ptr<IDataSource> dataSource,
           std::shared_ptr<IStreamTransform> transform,
           std::shared_ptr<ISampleSink> sink,
           PipelineOptions_t options = {});

  void run();

  const PerformanceMetrics& metrics() const { return performance; }

private:
  std::shared_ptr<IDataSource> dataSource;
  std::shared_ptr<IStreamTransform> transform;
  std::shared_ptr<ISampleSink> sink;
  PipelineOptions_t options;
  PerformanceMetrics performance;
};

} // namespace streamfilt
