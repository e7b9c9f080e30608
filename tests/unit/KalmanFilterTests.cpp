#include <cmath>
#include <random>

#include <gtest/gtest.h>

#include "streamfilt/core/Errors.hpp"
#include "streamfilt/core/KalmanFilter.hpp"

namespace {

constexpr double kPi = 3.14159265358979323846;

double maxAsymmetry(const streamfilt::Matrix& m) {
  return (m - m.transpose()).cwiseAbs().maxCoeff();
}

streamfilt::Vector vec2(double a, double b) {
  streamfilt::Vector v(2);
  v << a, b;
  return v;
}

} // namespace

TEST(KalmanFilterTests, StartsFromDocumentedDefaults) {
  streamfilt::LinearKalmanFilter kf(3);
  EXPECT_EQ(kf.dimState(), 3);
  EXPECT_EQ(kf.dimMeasurement(), 3);
  EXPECT_EQ(kf.dimControl(), 0);
  EXPECT_TRUE(kf.state().isZero());
  EXPECT_TRUE(kf.covariance().isIdentity());
  EXPECT_TRUE(kf.stateTransition().isIdentity());
  EXPECT_TRUE(kf.measurementFunction().isZero());
  EXPECT_TRUE(kf.processNoise().isIdentity());
  EXPECT_TRUE(kf.measurementNoise().isIdentity());
  EXPECT_EQ(kf.processMeasurementCrossCorrelation().rows(), 3);
  EXPECT_FALSE(kf.controlTransition().has_value());
  EXPECT_FALSE(kf.lastMeasurement().has_value());
  EXPECT_EQ(kf.residual().size(), 3);
  EXPECT_DOUBLE_EQ(kf.alpha(), 1.0);

  streamfilt::LinearKalmanFilter narrow(4, 2, 1);
  EXPECT_EQ(narrow.measurementFunction().rows(), 2);
  EXPECT_EQ(narrow.measurementFunction().cols(), 4);
  EXPECT_EQ(narrow.gain().rows(), 4);
  EXPECT_EQ(narrow.gain().cols(), 2);
}

TEST(KalmanFilterTests, NoiselessObservationOfStaticSystemKeepsState) {
  streamfilt::LinearKalmanFilter kf(2);
  kf.setMeasurementFunction(streamfilt::Matrix::Identity(2, 2));
  kf.setProcessNoise(streamfilt::Matrix::Zero(2, 2));
  kf.setMeasurementNoise(streamfilt::Matrix::Zero(2, 2));
  kf.initialize(vec2(1.5, -2.0));

  kf.predict();
  const streamfilt::Vector prior = kf.priorState();
  EXPECT_TRUE(kf.covariance().isIdentity(1e-12));

  kf.update(prior);
  EXPECT_TRUE(kf.state().isApprox(prior, 1e-12));
  EXPECT_TRUE(kf.residual().isZero(1e-12));
  // A perfect measurement leaves no uncertainty.
  EXPECT_TRUE(kf.covariance().isZero(1e-12));
  EXPECT_LT(maxAsymmetry(kf.covariance()), 1e-12);
}

TEST(KalmanFilterTests, MissingMeasurementKeepsEstimate) {
  streamfilt::LinearKalmanFilter kf(2);
  kf.setMeasurementFunction(streamfilt::Matrix::Identity(2, 2));
  kf.initialize(vec2(3.0, 4.0));
  kf.update(vec2(3.5, 4.5));
  ASSERT_TRUE(kf.lastMeasurement().has_value());

  kf.predict();
  const streamfilt::Vector x = kf.state();
  const streamfilt::Matrix P = kf.covariance();

  kf.update(std::nullopt);
  EXPECT_TRUE(kf.state().isApprox(x));
  EXPECT_TRUE(kf.covariance().isApprox(P));
  EXPECT_TRUE(kf.posteriorState().isApprox(x));
  EXPECT_TRUE(kf.posteriorCovariance().isApprox(P));
  ASSERT_EQ(kf.residual().size(), 2);
  EXPECT_TRUE(kf.residual().isZero());
  EXPECT_FALSE(kf.lastMeasurement().has_value());
}

TEST(KalmanFilterTests, CovarianceStaysSymmetric) {
  std::mt19937 rng(7);
  std::normal_distribution<double> normal(0.0, 1.0);

  streamfilt::LinearKalmanFilter kf(3, 2);
  streamfilt::Matrix F(3, 3);
  F << 1.0, 0.1, 0.005, 0.0, 1.0, 0.1, 0.0, 0.0, 1.0;
  streamfilt::Matrix H(2, 3);
  H << 1.0, 0.0, 0.0, 0.3, 1.0, -0.2;
  streamfilt::Matrix A = streamfilt::Matrix::Random(3, 3);
  kf.setStateTransition(F);
  kf.setMeasurementFunction(H);
  kf.setProcessNoise(A * A.transpose() * 0.01);
  kf.setMeasurementNoise(streamfilt::Matrix::Identity(2, 2) * 0.5);

  for (int i = 0; i < 100; ++i) {
    streamfilt::Vector z(2);
    z << normal(rng), normal(rng);
    if (i % 7 == 3) {
      kf.process(std::nullopt);
    } else {
      kf.process(z);
    }
    EXPECT_LT(maxAsymmetry(kf.covariance()), 1e-9) << "step " << i;
    EXPECT_GE(kf.covariance().diagonal().minCoeff(), 0.0);
  }
}

TEST(KalmanFilterTests, AlphaMustBeAtLeastOne) {
  streamfilt::LinearKalmanFilter kf(2);
  EXPECT_THROW(kf.setAlpha(0.5), streamfilt::ConfigurationError);
  EXPECT_THROW(kf.setAlpha(std::nan("")), streamfilt::ConfigurationError);
  EXPECT_DOUBLE_EQ(kf.alpha(), 1.0);

  kf.setAlpha(1.5);
  EXPECT_NEAR(kf.alpha(), 1.5, 1e-12);
}

TEST(KalmanFilterTests, FadingMemoryInflatesPredictedCovariance) {
  streamfilt::Matrix F(2, 2);
  F << 1.0, 1.0, 0.0, 1.0;

  streamfilt::LinearKalmanFilter plain(2);
  streamfilt::LinearKalmanFilter fading(2);
  plain.setStateTransition(F);
  fading.setStateTransition(F);
  fading.setAlpha(1.5);

  plain.predict();
  fading.predict();
  const streamfilt::Matrix excess = fading.covariance() - plain.covariance();
  EXPECT_GT(excess(0, 0), 0.0);
  EXPECT_GT(excess(1, 1), 0.0);
  // P = 2.25 * FIF' + I
  EXPECT_NEAR(fading.covariance()(0, 0), 2.25 * 2.0 + 1.0, 1e-12);
}

TEST(KalmanFilterTests, TracksConstantVelocityTarget) {
  std::mt19937 rng(1234);
  const double sigma = 0.5;
  std::normal_distribution<double> noise(0.0, sigma);

  streamfilt::LinearKalmanFilter kf(2, 1);
  streamfilt::Matrix F(2, 2);
  F << 1.0, 1.0, 0.0, 1.0;
  streamfilt::Matrix H(1, 2);
  H << 1.0, 0.0;
  kf.setStateTransition(F);
  kf.setMeasurementFunction(H);
  kf.setCovariance(streamfilt::Matrix::Identity(2, 2) * 100.0);
  kf.setProcessNoise(streamfilt::Matrix::Identity(2, 2) * 1e-5);
  kf.setMeasurementNoise(streamfilt::Matrix::Constant(1, 1, sigma * sigma));

  const double velocity = 0.5;
  double firstVariance = 0.0;
  double sumSqError = 0.0;
  int lateCount = 0;
  for (int k = 0; k < 200; ++k) {
    const double truth = 2.0 + velocity * k;
    const streamfilt::Vector z = streamfilt::Vector::Constant(1, truth + noise(rng));
    kf.process(z);
    if (k == 0) {
      firstVariance = kf.covariance()(0, 0);
    }
    if (k >= 100) {
      const double error = kf.state()(0) - truth;
      sumSqError += error * error;
      ++lateCount;
      EXPECT_LT(std::abs(error), 3.0 * sigma) << "step " << k;
    }
  }

  EXPECT_LT(kf.covariance()(0, 0), firstVariance);
  EXPECT_LT(kf.covariance()(0, 0), sigma * sigma);
  EXPECT_LT(std::sqrt(sumSqError / lateCount), sigma);
  EXPECT_NEAR(kf.state()(1), velocity, 0.05);
}

TEST(KalmanFilterTests, AppliesControlInput) {
  streamfilt::LinearKalmanFilter kf(2, 1, 1);
  streamfilt::Matrix B(2, 1);
  B << 0.5, 1.0;
  kf.setControlTransition(B);

  streamfilt::PredictOptions_t options;
  options.control = streamfilt::Vector(streamfilt::Vector::Constant(1, 2.0));
  kf.predict(options);
  EXPECT_NEAR(kf.state()(0), 1.0, 1e-12);
  EXPECT_NEAR(kf.state()(1), 2.0, 1e-12);

  // Without a control vector the model term is dropped.
  kf.predict();
  EXPECT_NEAR(kf.state()(0), 1.0, 1e-12);
}

TEST(KalmanFilterTests, PredictOverridesDoNotReplaceStoredModel) {
  streamfilt::LinearKalmanFilter kf(2);
  kf.initialize(vec2(1.0, 1.0));

  streamfilt::Matrix F(2, 2);
  F << 2.0, 0.0, 0.0, 3.0;
  streamfilt::PredictOptions_t options;
  options.stateTransition = F;
  options.processNoise = streamfilt::NoiseOverride_t{0.5};
  options.controlTransition = streamfilt::Matrix(streamfilt::Matrix::Ones(2, 1));
  options.control = streamfilt::Vector(streamfilt::Vector::Constant(1, 1.0));
  kf.predict(options);

  EXPECT_NEAR(kf.state()(0), 3.0, 1e-12);
  EXPECT_NEAR(kf.state()(1), 4.0, 1e-12);
  EXPECT_NEAR(kf.covariance()(0, 0), 4.5, 1e-12);
  EXPECT_NEAR(kf.covariance()(1, 1), 9.5, 1e-12);
  EXPECT_TRUE(kf.stateTransition().isIdentity());
  EXPECT_TRUE(kf.processNoise().isIdentity());
  EXPECT_FALSE(kf.controlTransition().has_value());
}

TEST(KalmanFilterTests, UpdateOverridesMeasurementModel) {
  streamfilt::LinearKalmanFilter kf(2);
  kf.initialize(vec2(1.0, 2.0));

  streamfilt::UpdateOptions_t options;
  streamfilt::Matrix H(2, 2);
  H << 1.0, 0.0, 0.0, 1.0;
  options.measurementFunction = H;
  options.measurementNoise = streamfilt::NoiseOverride_t{1.0};
  kf.update(vec2(3.0, 2.0), options);

  // P = I, R = I, so K = I/2.
  EXPECT_NEAR(kf.gain()(0, 0), 0.5, 1e-12);
  EXPECT_NEAR(kf.state()(0), 2.0, 1e-12);
  EXPECT_NEAR(kf.state()(1), 2.0, 1e-12);
  EXPECT_NEAR(kf.covariance()(0, 0), 0.5, 1e-12);
  EXPECT_TRUE(kf.measurementFunction().isZero());
  ASSERT_TRUE(kf.lastMeasurement().has_value());
  EXPECT_NEAR((*kf.lastMeasurement())(0), 3.0, 1e-12);
}

TEST(KalmanFilterTests, SingularInnovationCovarianceThrows) {
  streamfilt::LinearKalmanFilter kf(2);
  kf.setMeasurementFunction(streamfilt::Matrix::Identity(2, 2));
  kf.setCovariance(streamfilt::Matrix::Zero(2, 2));
  kf.setProcessNoise(streamfilt::Matrix::Zero(2, 2));
  kf.setMeasurementNoise(streamfilt::Matrix::Zero(2, 2));
  kf.initialize(vec2(1.0, 1.0));

  EXPECT_THROW(kf.process(vec2(2.0, 2.0)), streamfilt::NumericalError);
  EXPECT_TRUE(kf.state().isApprox(vec2(1.0, 1.0)));
}

TEST(KalmanFilterTests, RejectsIncompatibleDimensions) {
  EXPECT_THROW(streamfilt::LinearKalmanFilter(0), streamfilt::ConfigurationError);
  EXPECT_THROW(streamfilt::LinearKalmanFilter(2, 0), streamfilt::ConfigurationError);
  EXPECT_THROW(streamfilt::LinearKalmanFilter(2, 1, -1), streamfilt::ConfigurationError);

  streamfilt::LinearKalmanFilter kf(2, 1);
  EXPECT_THROW(kf.setStateTransition(streamfilt::Matrix::Identity(3, 3)), streamfilt::ConfigurationError);
  EXPECT_THROW(kf.setMeasurementFunction(streamfilt::Matrix::Identity(2, 2)), streamfilt::ConfigurationError);
  EXPECT_THROW(kf.setMeasurementNoise(streamfilt::Matrix::Identity(2, 2)), streamfilt::ConfigurationError);
  EXPECT_THROW(kf.setProcessNoise(streamfilt::Matrix::Identity(1, 1)), streamfilt::ConfigurationError);
  EXPECT_THROW(kf.setControlTransition(streamfilt::Matrix::Ones(2, 1)), streamfilt::ConfigurationError);
  EXPECT_THROW(kf.setProcessMeasurementCrossCorrelation(streamfilt::Matrix::Zero(1, 2)),
               streamfilt::ConfigurationError);
  EXPECT_THROW(kf.initialize(streamfilt::Vector::Zero(3)), streamfilt::ConfigurationError);

  streamfilt::Matrix asymmetric(2, 2);
  asymmetric << 1.0, 0.5, 0.0, 1.0;
  EXPECT_THROW(kf.setCovariance(asymmetric), streamfilt::ConfigurationError);
}

TEST(KalmanFilterTests, RejectsMalformedMeasurement) {
  streamfilt::LinearKalmanFilter kf(2, 1);
  kf.predict();
  EXPECT_THROW(kf.update(vec2(1.0, 2.0)), streamfilt::ShapeError);
  EXPECT_THROW(kf.residualOf(vec2(1.0, 2.0)), streamfilt::ShapeError);
  EXPECT_THROW(kf.measurementOfState(streamfilt::Vector::Zero(1)), streamfilt::ShapeError);

  streamfilt::PredictOptions_t options;
  options.processNoise = streamfilt::NoiseOverride_t{streamfilt::Matrix(streamfilt::Matrix::Identity(3, 3))};
  EXPECT_THROW(kf.predict(options), streamfilt::ShapeError);
}

TEST(KalmanFilterTests, RejectedMeasurementLeavesCycleUntouched) {
  streamfilt::LinearKalmanFilter kf(1);
  kf.setMeasurementFunction(streamfilt::Matrix::Identity(1, 1));
  const streamfilt::Matrix covarianceBefore = kf.covariance();
  const streamfilt::Vector stateBefore = kf.state();

  EXPECT_THROW(kf.process(vec2(1.0, 2.0)), streamfilt::ShapeError);
  EXPECT_TRUE(kf.covariance().isApprox(covarianceBefore));
  EXPECT_TRUE(kf.state().isApprox(stateBefore));
  EXPECT_TRUE(kf.priorCovariance().isApprox(covarianceBefore));

  streamfilt::Sample_t sample;
  sample.values = vec2(1.0, 2.0);
  EXPECT_THROW(kf.process(sample), streamfilt::ShapeError);
  EXPECT_DOUBLE_EQ(kf.covariance()(0, 0), covarianceBefore(0, 0));

  kf.process(streamfilt::Vector(streamfilt::Vector::Constant(1, 2.0)));
  EXPECT_NEAR(kf.priorCovariance()(0, 0), 2.0, 1e-12);
}

TEST(KalmanFilterTests, ResidualOfUsesPriorWithoutMutation) {
  streamfilt::LinearKalmanFilter kf(2, 1);
  streamfilt::Matrix H(1, 2);
  H << 1.0, 2.0;
  kf.setMeasurementFunction(H);
  kf.initialize(vec2(1.0, 1.0));
  kf.predict();

  const streamfilt::Vector x = kf.state();
  const streamfilt::Vector z = streamfilt::Vector::Constant(1, 5.0);
  const streamfilt::Vector residual = kf.residualOf(z);
  EXPECT_NEAR(residual(0), 2.0, 1e-12);
  EXPECT_TRUE(kf.state().isApprox(x));

  const streamfilt::Vector projected = kf.measurementOfState(vec2(2.0, -1.0));
  ASSERT_EQ(projected.size(), 1);
  EXPECT_NEAR(projected(0), 0.0, 1e-12);
}

TEST(KalmanFilterTests, SnapshotsAreIndependentCopies) {
  streamfilt::LinearKalmanFilter kf(1);
  kf.setMeasurementFunction(streamfilt::Matrix::Identity(1, 1));
  kf.predict();
  const double priorVariance = kf.priorCovariance()(0, 0);
  EXPECT_NEAR(priorVariance, 2.0, 1e-12);

  const streamfilt::Vector z = streamfilt::Vector::Constant(1, 4.0);
  kf.update(z);
  EXPECT_NEAR(kf.priorState()(0), 0.0, 1e-12);
  EXPECT_NEAR(kf.priorCovariance()(0, 0), priorVariance, 1e-12);
  EXPECT_NEAR(kf.posteriorState()(0), kf.state()(0), 1e-12);
  EXPECT_LT(kf.posteriorCovariance()(0, 0), priorVariance);
}

TEST(KalmanFilterTests, InnovationStatisticsFollowLastUpdate) {
  streamfilt::LinearKalmanFilter kf(1);
  kf.setMeasurementFunction(streamfilt::Matrix::Identity(1, 1));
  kf.predict();
  const streamfilt::Vector z = streamfilt::Vector::Constant(1, 3.0);
  kf.update(z);

  // y = 3, S = 2 + 1
  EXPECT_NEAR(kf.innovationCovariance()(0, 0), 3.0, 1e-12);
  EXPECT_NEAR(kf.innovationCovarianceInverse()(0, 0), 1.0 / 3.0, 1e-12);
  EXPECT_NEAR(kf.mahalanobis(), std::sqrt(3.0), 1e-12);
  const double expected = -0.5 * (std::log(2.0 * kPi) + std::log(3.0) + 3.0);
  EXPECT_NEAR(kf.logLikelihood(), expected, 1e-12);
  EXPECT_NEAR(kf.likelihood(), std::exp(expected), 1e-12);

  kf.predict();
  kf.update(std::nullopt);
  EXPECT_DOUBLE_EQ(kf.mahalanobis(), 0.0);
}

TEST(KalmanFilterTests, ProcessesSamplesThroughStreamInterface) {
  streamfilt::LinearKalmanFilter kf(1);
  kf.setMeasurementFunction(streamfilt::Matrix::Identity(1, 1));
  streamfilt::IStreamTransform& transform = kf;

  streamfilt::Sample_t sample;
  sample.values = streamfilt::Vector::Constant(1, 3.0);
  const streamfilt::TransformOutput_t output = transform.process(sample);
  ASSERT_EQ(output.value.size(), 1);
  EXPECT_NEAR(output.value(0), 2.0, 1e-12);
  EXPECT_NEAR(output.covariance(0, 0), 2.0 / 3.0, 1e-12);
  EXPECT_NEAR(output.residual(0), 3.0, 1e-12);
  EXPECT_NEAR(output.nis, 3.0, 1e-12);

  streamfilt::Sample_t missing;
  missing.missing = true;
  const streamfilt::TransformOutput_t skipped = transform.process(missing);
  EXPECT_NEAR(skipped.value(0), 2.0, 1e-12);
  EXPECT_DOUBLE_EQ(skipped.nis, 0.0);
}
