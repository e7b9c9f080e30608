#pragma once

#include "streamfilt/core/Types.hpp"
#include "streamfilt/data/Sample.hpp"

namespace streamfilt {

// Result of pushing one sample through a transform.
struct TransformOutput_t {
  Vector value;
  // State covariance for estimators, empty otherwise.
  Matrix covariance;
  // Difference between the raw input and what the transform expected or produced.
  Vector residual;
  // Normalized innovation squared, zero where not defined.
  double nis = 0.0;
};

// Stateful single-input/single-output stream transform.
class IStreamTransform {
public:
  virtual ~IStreamTransform() = default;
  virtual TransformOutput_t process(const Sample_t& sample) = 0;
};

} // namespace streamfilt
