#pragma once

#include <cstddef>

#include "streamfilt/core/Types.hpp"

namespace streamfilt {

// Running residual statistics over the samples a transform has processed.
// Residual and NIS averages cover observed samples only; missing samples are
// counted apart and contribute runtime.
class PerformanceMetrics {
public:
  void update(const Vector& residual, double nis, double runtimeMs);
  void recordMissing(double runtimeMs);
  void recordSkipped();

  double lastResidual() const { return lastResidualValue; }
  double lastNis() const { return lastNisValue; }
  double lastRuntimeMs() const { return lastRuntimeMsValue; }
  std::size_t samples() const { return sampleCount; }
  std::size_t missing() const { return missingCount; }
  std::size_t skipped() const { return skippedCount; }

  // Residual magnitudes are Euclidean norms of the residual vector.
  double meanAbsResidual() const;
  double rmse() const;
  double meanNis() const;
  double meanRuntimeMs() const;

private:
  double sumAbsResidual = 0.0;
  double sumSqResidual = 0.0;
  double sumNis = 0.0;
  double sumRuntimeMs = 0.0;
  double lastResidualValue = 0.0;
  double lastNisValue = 0.0;
  double lastRuntimeMsValue = 0.0;
  std::size_t sampleCount = 0;
  std::size_t missingCount = 0;
  std::size_t skippedCount = 0;
};

} // namespace streamfilt
