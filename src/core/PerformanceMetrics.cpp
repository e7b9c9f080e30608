#include "streamfilt/core/PerformanceMetrics.hpp"

#include <cmath>

namespace streamfilt {

void PerformanceMetrics::update(const Vector& residual, double nis, double runtimeMs) {
  const double magnitude = residual.size() > 0 ? residual.norm() : 0.0;
  lastResidualValue = magnitude;
  lastNisValue = nis;
  lastRuntimeMsValue = runtimeMs;

  sumAbsResidual += magnitude;
  sumSqResidual += magnitude * magnitude;
  sumNis += nis;
  sumRuntimeMs += runtimeMs;
  ++sampleCount;
}

void PerformanceMetrics::recordMissing(double runtimeMs) {
  lastRuntimeMsValue = runtimeMs;
  sumRuntimeMs += runtimeMs;
  ++missingCount;
}

void PerformanceMetrics::recordSkipped() {
  ++skippedCount;
}

double PerformanceMetrics::meanAbsResidual() const {
  if (sampleCount == 0) {
    return 0.0;
  }
  return sumAbsResidual / static_cast<double>(sampleCount);
}

double PerformanceMetrics::rmse() const {
  if (sampleCount == 0) {
    return 0.0;
  }
  return std::sqrt(sumSqResidual / static_cast<double>(sampleCount));
}

double PerformanceMetrics::meanNis() const {
  if (sampleCount == 0) {
    return 0.0;
  }
  return sumNis / static_cast<double>(sampleCount);
}

double PerformanceMetrics::meanRuntimeMs() const {
  const std::size_t timed = sampleCount + missingCount;
  if (timed == 0) {
    return 0.0;
  }
  return sumRuntimeMs / static_cast<double>(timed);
}

} // namespace streamfilt
