#pragma once

#include <cstddef>
#include <optional>
#include <variant>

#include "streamfilt/core/Transform.hpp"

namespace streamfilt {

// Noise given either as a full matrix or as a scalar times identity.
using NoiseOverride_t = std::variant<double, Matrix>;

// Per-call overrides for predict(). Unset fields use the stored model.
struct PredictOptions_t {
  std::optional<Vector> control;
  std::optional<Matrix> controlTransition;
  std::optional<Matrix> stateTransition;
  std::optional<NoiseOverride_t> processNoise;
};

// Per-call overrides for update(). Unset fields use the stored model.
struct UpdateOptions_t {
  std::optional<NoiseOverride_t> measurementNoise;
  std::optional<Matrix> measurementFunction;
};

// Discrete-time linear Kalman filter with optional fading memory.
//
// Model matrices default to F = I, H = 0, Q = I, R = I, B unset. The posterior
// covariance uses the Joseph form so that P stays symmetric under rounding.
class LinearKalmanFilter : public IStreamTransform {
public:
  explicit LinearKalmanFilter(int dimState, std::optional<int> dimMeasurement = std::nullopt, int dimControl = 0);

  TransformOutput_t process(const Sample_t& sample) override;

  // predict() followed by update(); returns the posterior state.
  const Vector& process(const std::optional<Vector>& measurement,
                        const PredictOptions_t& predictOptions = {},
                        const UpdateOptions_t& updateOptions = {});

  void predict(const PredictOptions_t& options = {});

  // std::nullopt means no observation this cycle.
  void update(const std::optional<Vector>& measurement, const UpdateOptions_t& options = {});

  Vector residualOf(const Vector& measurement) const;
  Vector measurementOfState(const Vector& state) const;

  void initialize(const Vector& initialState);

  double alpha() const;
  void setAlpha(double value);

  void setCovariance(const Matrix& value);
  void setStateTransition(const Matrix& value);
  void setControlTransition(const Matrix& value);
  void setMeasurementFunction(const Matrix& value);
  void setProcessNoise(const Matrix& value);
  void setMeasurementNoise(const Matrix& value);
  void setProcessMeasurementCrossCorrelation(const Matrix& value);

  int dimState() const { return stateDim; }
  int dimMeasurement() const { return measurementDim; }
  int dimControl() const { return controlDim; }

  const Vector& state() const { return x; }
  const Matrix& covariance() const { return P; }
  const Matrix& stateTransition() const { return F; }
  const std::optional<Matrix>& controlTransition() const { return B; }
  const Matrix& measurementFunction() const { return H; }
  const Matrix& processNoise() const { return Q; }
  const Matrix& measurementNoise() const { return R; }
  const Matrix& processMeasurementCrossCorrelation() const { return M; }

  const Vector& priorState() const { return xPrior; }
  const Matrix& priorCovariance() const { return PPrior; }
  const Vector& posteriorState() const { return xPost; }
  const Matrix& posteriorCovariance() const { return PPost; }
  const Matrix& gain() const { return K; }
  const Vector& residual() const { return y; }
  const Matrix& innovationCovariance() const { return S; }
  const Matrix& innovationCovarianceInverse() const { return SI; }
  const std::optional<Vector>& lastMeasurement() const { return z; }

  // Statistics of the last innovation, cached until the next update().
  double logLikelihood() const;
  double likelihood() const;
  double mahalanobis() const;

private:
  void invalidateStatistics();
  void requireMeasurementShape(const Vector& measurement, const UpdateOptions_t& options) const;

  int stateDim = 0;
  int measurementDim = 0;
  int controlDim = 0;

  Vector x;
  Matrix P;
  Matrix F;
  std::optional<Matrix> B;
  Matrix H;
  Matrix Q;
  Matrix R;
  Matrix M;
  double alphaSq = 1.0;

  std::optional<Vector> z;
  Matrix K;
  Vector y;
  Matrix S;
  Matrix SI;
  Matrix I;

  Vector xPrior;
  Matrix PPrior;
  Vector xPost;
  Matrix PPost;

  mutable std::optional<double> cachedLogLikelihood;
  mutable std::optional<double> cachedLikelihood;
  mutable std::optional<double> cachedMahalanobis;

  std::size_t predictCount = 0;
  std::size_t updateCount = 0;
};

} // namespace streamfilt
