#include "streamfilt/core/KalmanFilter.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <string>

#include "streamfilt/core/Errors.hpp"
#include "streamfilt/core/Logger.hpp"

namespace streamfilt {

namespace {

constexpr double kLog2Pi = 1.8378770664093453;
constexpr double kSymmetryTolerance = 1e-9;

std::string shapeString(Eigen::Index rows, Eigen::Index cols) {
  return std::to_string(rows) + "x" + std::to_string(cols);
}

template <typename Error>
void requireShape(const Matrix& value, Eigen::Index rows, Eigen::Index cols, const char* name) {
  if (value.rows() != rows || value.cols() != cols) {
    throw Error(std::string("LinearKalmanFilter: ") + name + " must be " + shapeString(rows, cols) + ", got " +
                shapeString(value.rows(), value.cols()));
  }
}

template <typename Error>
void requireSize(const Vector& value, Eigen::Index size, const char* name) {
  if (value.size() != size) {
    throw Error(std::string("LinearKalmanFilter: ") + name + " must have " + std::to_string(size) +
                " entries, got " + std::to_string(value.size()));
  }
}

Matrix resolveNoise(const NoiseOverride_t& noise, int dim, const char* name) {
  if (const double* scalar = std::get_if<double>(&noise)) {
    return Matrix::Identity(dim, dim) * (*scalar);
  }
  const Matrix& matrix = std::get<Matrix>(noise);
  requireShape<ShapeError>(matrix, dim, dim, name);
  return matrix;
}

} // namespace

LinearKalmanFilter::LinearKalmanFilter(int dimStateInput, std::optional<int> dimMeasurementInput, int dimControlInput)
    : stateDim(dimStateInput),
      measurementDim(dimMeasurementInput.value_or(dimStateInput)),
      controlDim(dimControlInput) {
  if (stateDim <= 0) {
    throw ConfigurationError("LinearKalmanFilter: dimState must be positive");
  }
  if (measurementDim <= 0) {
    throw ConfigurationError("LinearKalmanFilter: dimMeasurement must be positive");
  }
  if (controlDim < 0) {
    throw ConfigurationError("LinearKalmanFilter: dimControl must not be negative");
  }

  const int n = stateDim;
  const int m = measurementDim;
  x = Vector::Zero(n);
  P = Matrix::Identity(n, n);
  Q = Matrix::Identity(n, n);
  F = Matrix::Identity(n, n);
  H = Matrix::Zero(m, n);
  R = Matrix::Identity(m, m);
  M = Matrix::Zero(n, m);

  K = Matrix::Zero(n, m);
  y = Vector::Zero(m);
  S = Matrix::Zero(m, m);
  SI = Matrix::Zero(m, m);
  I = Matrix::Identity(n, n);

  xPrior = x;
  PPrior = P;
  xPost = x;
  PPost = P;

  if (auto logger = Logger::GetClass("LinearKalmanFilter")) {
    logger->info("LinearKalmanFilter created dimState {} dimMeasurement {} dimControl {}", n, m, controlDim);
  }
}

TransformOutput_t LinearKalmanFilter::process(const Sample_t& sample) {
  std::optional<Vector> measurement;
  if (!sample.missing) {
    measurement = sample.values;
  }
  process(measurement);

  TransformOutput_t output;
  output.value = x;
  output.covariance = P;
  output.residual = y;
  if (!sample.missing) {
    const double distance = mahalanobis();
    output.nis = distance * distance;
  }
  return output;
}

const Vector& LinearKalmanFilter::process(const std::optional<Vector>& measurement,
                                          const PredictOptions_t& predictOptions,
                                          const UpdateOptions_t& updateOptions) {
  // Reject a malformed measurement before predict() advances x and P.
  if (measurement) {
    requireMeasurementShape(*measurement, updateOptions);
  }
  predict(predictOptions);
  update(measurement, updateOptions);
  return x;
}

void LinearKalmanFilter::predict(const PredictOptions_t& options) {
  const Matrix& Fm = options.stateTransition ? *options.stateTransition : F;
  if (options.stateTransition) {
    requireShape<ShapeError>(Fm, stateDim, stateDim, "state transition override");
  }
  const std::optional<Matrix>& Bm = options.controlTransition ? options.controlTransition : B;
  const Matrix Qm = options.processNoise ? resolveNoise(*options.processNoise, stateDim, "process noise override") : Q;

  // x = Fx + Bu
  if (Bm && options.control) {
    requireShape<ShapeError>(*Bm, stateDim, Bm->cols(), "control transition");
    requireSize<ShapeError>(*options.control, Bm->cols(), "control vector");
    x = Fm * x + (*Bm) * (*options.control);
  } else {
    x = Fm * x;
  }

  // P = a^2 FPF' + Q
  P = alphaSq * (Fm * P * Fm.transpose()) + Qm;

  xPrior = x;
  PPrior = P;

  if ((predictCount % 50) == 0) {
    if (auto logger = Logger::GetClass("LinearKalmanFilter")) {
      logger->debug("LinearKalmanFilter predict step {} x0 {:.4f} P00 {:.4e}", predictCount, x(0), P(0, 0));
    }
  }
  ++predictCount;
}

void LinearKalmanFilter::update(const std::optional<Vector>& measurement, const UpdateOptions_t& options) {
  invalidateStatistics();

  if (!measurement) {
    z.reset();
    xPost = x;
    PPost = P;
    y = Vector::Zero(measurementDim);
    return;
  }

  requireMeasurementShape(*measurement, options);
  const Matrix Rm =
      options.measurementNoise ? resolveNoise(*options.measurementNoise, measurementDim, "measurement noise override")
                               : R;
  const Matrix& Hm = options.measurementFunction ? *options.measurementFunction : H;
  requireShape<ShapeError>(Rm, Hm.rows(), Hm.rows(), "measurement noise");

  // y = z - Hx
  y = *measurement - Hm * x;

  const Matrix PHT = P * Hm.transpose();

  // S = HPH' + R
  S = Hm * PHT + Rm;
  Eigen::FullPivLU<Matrix> lu(S);
  if (!lu.isInvertible()) {
    throw NumericalError("LinearKalmanFilter: innovation covariance is singular");
  }
  SI = lu.inverse();

  // K = PH'inv(S)
  K = PHT * SI;

  x = x + K * y;

  // P = (I-KH)P(I-KH)' + KRK'
  const Matrix IKH = I - K * Hm;
  P = IKH * P * IKH.transpose() + K * Rm * K.transpose();

  z = *measurement;
  xPost = x;
  PPost = P;

  if ((updateCount % 50) == 0) {
    if (auto logger = Logger::GetClass("LinearKalmanFilter")) {
      logger->debug("LinearKalmanFilter update step {} y0 {:.4e} |K| {:.4e} x0 {:.4f}",
                    updateCount,
                    y(0),
                    K.norm(),
                    x(0));
    }
  }
  ++updateCount;
}

void LinearKalmanFilter::requireMeasurementShape(const Vector& measurement, const UpdateOptions_t& options) const {
  const Matrix& Hm = options.measurementFunction ? *options.measurementFunction : H;
  if (options.measurementFunction) {
    requireShape<ShapeError>(Hm, Hm.rows(), stateDim, "measurement function override");
  }
  requireSize<ShapeError>(measurement, Hm.rows(), "measurement");
}

Vector LinearKalmanFilter::residualOf(const Vector& measurement) const {
  requireSize<ShapeError>(measurement, measurementDim, "measurement");
  return measurement - H * xPrior;
}

Vector LinearKalmanFilter::measurementOfState(const Vector& state) const {
  requireSize<ShapeError>(state, stateDim, "state");
  return H * state;
}

void LinearKalmanFilter::initialize(const Vector& initialState) {
  requireSize<ConfigurationError>(initialState, stateDim, "initial state");
  x = initialState;
  xPrior = x;
  xPost = x;
}

double LinearKalmanFilter::alpha() const {
  return std::sqrt(alphaSq);
}

void LinearKalmanFilter::setAlpha(double value) {
  if (!std::isfinite(value) || value < 1.0) {
    throw ConfigurationError("LinearKalmanFilter: alpha must be a finite value >= 1");
  }
  alphaSq = value * value;
}

void LinearKalmanFilter::setCovariance(const Matrix& value) {
  requireShape<ConfigurationError>(value, stateDim, stateDim, "covariance");
  const double asymmetry = (value - value.transpose()).cwiseAbs().maxCoeff();
  if (asymmetry > kSymmetryTolerance * std::max(1.0, value.cwiseAbs().maxCoeff())) {
    throw ConfigurationError("LinearKalmanFilter: covariance must be symmetric");
  }
  P = value;
  PPrior = P;
  PPost = P;
}

void LinearKalmanFilter::setStateTransition(const Matrix& value) {
  requireShape<ConfigurationError>(value, stateDim, stateDim, "state transition");
  F = value;
}

void LinearKalmanFilter::setControlTransition(const Matrix& value) {
  if (controlDim == 0) {
    throw ConfigurationError("LinearKalmanFilter: control transition requires dimControl > 0");
  }
  requireShape<ConfigurationError>(value, stateDim, controlDim, "control transition");
  B = value;
}

void LinearKalmanFilter::setMeasurementFunction(const Matrix& value) {
  requireShape<ConfigurationError>(value, measurementDim, stateDim, "measurement function");
  H = value;
}

void LinearKalmanFilter::setProcessNoise(const Matrix& value) {
  requireShape<ConfigurationError>(value, stateDim, stateDim, "process noise");
  Q = value;
}

void LinearKalmanFilter::setMeasurementNoise(const Matrix& value) {
  requireShape<ConfigurationError>(value, measurementDim, measurementDim, "measurement noise");
  R = value;
}

void LinearKalmanFilter::setProcessMeasurementCrossCorrelation(const Matrix& value) {
  requireShape<ConfigurationError>(value, stateDim, measurementDim, "process-measurement cross correlation");
  M = value;
}

double LinearKalmanFilter::logLikelihood() const {
  if (!cachedLogLikelihood) {
    Eigen::FullPivLU<Matrix> lu(S);
    if (!lu.isInvertible()) {
      cachedLogLikelihood = -std::numeric_limits<double>::infinity();
    } else {
      const double logDet = std::log(std::abs(lu.determinant()));
      const double quad = y.dot(SI * y);
      cachedLogLikelihood = -0.5 * (static_cast<double>(y.size()) * kLog2Pi + logDet + quad);
    }
  }
  return *cachedLogLikelihood;
}

double LinearKalmanFilter::likelihood() const {
  if (!cachedLikelihood) {
    double value = std::exp(logLikelihood());
    if (value == 0.0) {
      value = std::numeric_limits<double>::min();
    }
    cachedLikelihood = value;
  }
  return *cachedLikelihood;
}

double LinearKalmanFilter::mahalanobis() const {
  if (!cachedMahalanobis) {
    cachedMahalanobis = std::sqrt(std::max(0.0, y.dot(SI * y)));
  }
  return *cachedMahalanobis;
}

void LinearKalmanFilter::invalidateStatistics() {
  cachedLogLikelihood.reset();
  cachedLikelihood.reset();
  cachedMahalanobis.reset();
}

} // namespace streamfilt
