#include "streamfilt/pipeline/Pipeline.hpp"

#include <chrono>
#include <utility>

#include "streamfilt/core/Errors.hpp"
#include "streamfilt/core/Logger.hpp"

namespace streamfilt {

Pipeline::Pipeline(std::shared_ptr<IDataSource> dataSource,
                   std::shared_ptr<IStreamTransform> transform,
                   std::shared_ptr<ISampleSink> sink,
                   PipelineOptions_t optionsInput)
    : dataSource(std::move(dataSource)),
      transform(std::move(transform)),
      sink(std::move(sink)),
      options(optionsInput) {
  if (auto logger = Logger::GetClass("Pipeline")) {
    logger->info("Pipeline created maxSamples {} abortOnError {}",
                 options.maxSamples == 0 ? -1 : static_cast<long long>(options.maxSamples),
                 options.abortOnError);
  }
}

void Pipeline::run() {
  Sample_t sample;
  std::size_t stepCount = 0;
  while (dataSource && transform && dataSource->next(sample)) {
    if (options.maxSamples > 0 && stepCount >= options.maxSamples) {
      if (auto logger = Logger::GetClass("Pipeline")) {
        logger->info("Pipeline: reached max samples {}", options.maxSamples);
      }
      break;
    }
    ++stepCount;

    const auto start = std::chrono::steady_clock::now();
    TransformOutput_t output;
    try {
      output = transform->process(sample);
    } catch (const FilterError& ex) {
      if (options.abortOnError) {
        if (auto logger = Logger::Get()) {
          logger->error("Pipeline: sample at t={:.6f} failed: {}", sample.time, ex.what());
        }
        throw;
      }
      performance.recordSkipped();
      if (auto logger = Logger::Get()) {
        logger->warn("Pipeline: skipping sample at t={:.6f}: {}", sample.time, ex.what());
      }
      continue;
    }
    const double runtimeMs =
        std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start).count();

    if (sample.missing) {
      performance.recordMissing(runtimeMs);
    } else {
      performance.update(output.residual, output.nis, runtimeMs);
    }
    if (sink) {
      sink->consume(sample, output);
    }

    if (((stepCount - 1) % 200) == 0) {
      if (auto logger = Logger::GetClass("Pipeline")) {
        logger->debug("Pipeline step {} time {:.3f} missing {} residual {:.4e}",
                      stepCount - 1,
                      sample.time,
                      sample.missing,
                      performance.lastResidual());
      }
    }
  }
  if (auto logger = Logger::GetClass("Pipeline")) {
    logger->info("Pipeline completed after {} samples ({} missing, {} skipped), residual rmse {:.4e}",
                 stepCount,
                 performance.missing(),
                 performance.skipped(),
                 performance.rmse());
  }
}

} // namespace streamfilt
