#pragma once

#include <array>
#include <cstddef>
#include <deque>
#include <string>
#include <variant>
#include <vector>

#include "streamfilt/core/Transform.hpp"

namespace streamfilt {

// Numerator/denominator ("ba") coefficients.
struct TransferFunction_t {
  std::vector<double> numerator;
  std::vector<double> denominator;
};

// Cascaded biquads ("sos"), each row is b0 b1 b2 a0 a1 a2.
struct SecondOrderSections_t {
  std::vector<std::array<double, 6>> sections;
};

using FilterCoefficients_t = std::variant<TransferFunction_t, SecondOrderSections_t>;

enum class CoefficientForm_e {
  kTransferFunction,
  kSecondOrderSections
};

// Maps "ba"/"sos" to a coefficient form, throws ConfigurationError otherwise.
CoefficientForm_e parseCoefficientForm(const std::string& value);

// Streaming IIR filter over a bounded history of raw samples.
//
// Every call appends the new sample and reruns the recursion over the whole
// buffer from zero initial conditions, returning the value at the newest
// position. Outputs drift until the buffer has filled.
class StreamingIirFilter : public IStreamTransform {
public:
  static constexpr std::size_t kDefaultBufferSize = 256;

  // axis 0 filters each channel over time, axis 1 filters across channels.
  explicit StreamingIirFilter(FilterCoefficients_t coefficients,
                              std::size_t bufferSize = kDefaultBufferSize,
                              int axis = 0);

  TransformOutput_t process(const Sample_t& sample) override;
  Vector process(const Vector& sample);
  double process(double sample);

  CoefficientForm_e form() const;
  const FilterCoefficients_t& coefficients() const { return coefs; }
  const std::deque<Vector>& history() const { return buffer; }
  std::size_t capacity() const { return bufferSize; }
  int axis() const { return filterAxis; }

private:
  Vector filterBuffer() const;

  FilterCoefficients_t coefs;
  std::deque<Vector> buffer;
  std::size_t bufferSize = kDefaultBufferSize;
  int filterAxis = 0;
  Eigen::Index channels = 0;
  std::size_t stepCount = 0;
};

} // namespace streamfilt
