#include "streamfilt/core/IirFilter.hpp"

#include <algorithm>
#include <string>
#include <type_traits>
#include <utility>

#include "streamfilt/core/Errors.hpp"
#include "streamfilt/core/Logger.hpp"

namespace streamfilt {

namespace {

// Direct-form II transposed recursion with zero initial conditions.
Vector transferFunctionFilter(const TransferFunction_t& tf, const Vector& x) {
  const std::size_t order = std::max(tf.numerator.size(), tf.denominator.size());
  const double a0 = tf.denominator.front();
  std::vector<double> b(order, 0.0);
  std::vector<double> a(order, 0.0);
  for (std::size_t i = 0; i < tf.numerator.size(); ++i) {
    b[i] = tf.numerator[i] / a0;
  }
  for (std::size_t i = 0; i < tf.denominator.size(); ++i) {
    a[i] = tf.denominator[i] / a0;
  }

  Vector y(x.size());
  std::vector<double> z(order > 1 ? order - 1 : 0, 0.0);
  for (Eigen::Index n = 0; n < x.size(); ++n) {
    const double xn = x(n);
    if (z.empty()) {
      y(n) = b[0] * xn;
      continue;
    }
    const double yn = b[0] * xn + z[0];
    for (std::size_t i = 0; i + 1 < z.size(); ++i) {
      z[i] = b[i + 1] * xn + z[i + 1] - a[i + 1] * yn;
    }
    z.back() = b[order - 1] * xn - a[order - 1] * yn;
    y(n) = yn;
  }
  return y;
}

// Cascade of biquads, each fed the previous section's output.
Vector sectionsFilter(const SecondOrderSections_t& sos, const Vector& x) {
  Vector signal = x;
  for (const auto& s : sos.sections) {
    double z0 = 0.0;
    double z1 = 0.0;
    for (Eigen::Index n = 0; n < signal.size(); ++n) {
      const double xn = signal(n);
      const double yn = s[0] * xn + z0;
      z0 = s[1] * xn - s[4] * yn + z1;
      z1 = s[2] * xn - s[5] * yn;
      signal(n) = yn;
    }
  }
  return signal;
}

struct CoefficientValidator {
  void operator()(const TransferFunction_t& tf) const {
    if (tf.numerator.empty() || tf.denominator.empty()) {
      throw ConfigurationError("StreamingIirFilter: transfer function needs numerator and denominator");
    }
    if (tf.denominator.front() == 0.0) {
      throw ConfigurationError("StreamingIirFilter: leading denominator coefficient must be non-zero");
    }
  }

  void operator()(const SecondOrderSections_t& sos) const {
    if (sos.sections.empty()) {
      throw ConfigurationError("StreamingIirFilter: second-order sections table is empty");
    }
    for (const auto& section : sos.sections) {
      if (section[3] != 1.0) {
        throw ConfigurationError("StreamingIirFilter: every section needs a0 == 1");
      }
    }
  }
};

} // namespace

CoefficientForm_e parseCoefficientForm(const std::string& value) {
  if (value == "ba") {
    return CoefficientForm_e::kTransferFunction;
  }
  if (value == "sos") {
    return CoefficientForm_e::kSecondOrderSections;
  }
  throw ConfigurationError("Unrecognized coefficient form '" + value + "' (expected 'ba' or 'sos')");
}

StreamingIirFilter::StreamingIirFilter(FilterCoefficients_t coefficients, std::size_t bufferSizeInput, int axis)
    : coefs(std::move(coefficients)),
      bufferSize(bufferSizeInput),
      filterAxis(axis) {
  std::visit(CoefficientValidator{}, coefs);
  if (bufferSize == 0) {
    throw ConfigurationError("StreamingIirFilter: buffer size must be positive");
  }
  if (filterAxis != 0 && filterAxis != 1) {
    throw ConfigurationError("StreamingIirFilter: axis must be 0 or 1");
  }
  if (auto logger = Logger::GetClass("StreamingIirFilter")) {
    logger->info("StreamingIirFilter created form {} buffer {} axis {}",
                 form() == CoefficientForm_e::kTransferFunction ? "ba" : "sos",
                 bufferSize,
                 filterAxis);
  }
}

CoefficientForm_e StreamingIirFilter::form() const {
  return std::holds_alternative<TransferFunction_t>(coefs) ? CoefficientForm_e::kTransferFunction
                                                           : CoefficientForm_e::kSecondOrderSections;
}

TransformOutput_t StreamingIirFilter::process(const Sample_t& sample) {
  if (sample.missing) {
    throw ShapeError("StreamingIirFilter: cannot filter a missing sample");
  }
  TransformOutput_t output;
  output.value = process(sample.values);
  output.residual = sample.values - output.value;
  return output;
}

Vector StreamingIirFilter::process(const Vector& sample) {
  if (sample.size() == 0) {
    throw ShapeError("StreamingIirFilter: empty sample");
  }
  if (channels == 0) {
    channels = sample.size();
  } else if (sample.size() != channels) {
    throw ShapeError("StreamingIirFilter: expected " + std::to_string(channels) + " channels, got " +
                     std::to_string(sample.size()));
  }

  buffer.push_back(sample);
  if (buffer.size() > bufferSize) {
    buffer.pop_front();
  }

  Vector filtered = filterBuffer();
  if ((stepCount % 200) == 0) {
    if (auto logger = Logger::GetClass("StreamingIirFilter")) {
      logger->debug("StreamingIirFilter step {} buffered {} in {:.4f} out {:.4f}",
                    stepCount,
                    buffer.size(),
                    sample(0),
                    filtered(0));
    }
  }
  ++stepCount;
  return filtered;
}

double StreamingIirFilter::process(double sample) {
  return process(Vector::Constant(1, sample))(0);
}

Vector StreamingIirFilter::filterBuffer() const {
  auto run = [this](const Vector& signal) {
    return std::visit(
        [&signal](const auto& c) -> Vector {
          using T = std::decay_t<decltype(c)>;
          if constexpr (std::is_same_v<T, TransferFunction_t>) {
            return transferFunctionFilter(c, signal);
          } else {
            return sectionsFilter(c, signal);
          }
        },
        coefs);
  };

  if (filterAxis == 1) {
    // Rows are independent along the channel axis, so only the newest row matters.
    return run(buffer.back());
  }

  const Eigen::Index length = static_cast<Eigen::Index>(buffer.size());
  Vector result(channels);
  Vector signal(length);
  for (Eigen::Index c = 0; c < channels; ++c) {
    for (Eigen::Index t = 0; t < length; ++t) {
      signal(t) = buffer[static_cast<std::size_t>(t)](c);
    }
    result(c) = run(signal)(length - 1);
  }
  return result;
}

} // namespace streamfilt
