#pragma once

#include <stdexcept>
#include <string>

namespace streamfilt {

// Base for every error raised by the filters.
class FilterError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// Invalid construction or setter arguments (coefficients, dimensions, alpha).
class ConfigurationError : public FilterError {
public:
  using FilterError::FilterError;
};

// Numerical failure inside a recursion step, e.g. a singular innovation covariance.
class NumericalError : public FilterError {
public:
  using FilterError::FilterError;
};

// Per-sample input with the wrong shape.
class ShapeError : public FilterError {
public:
  using FilterError::FilterError;
};

} // namespace streamfilt
