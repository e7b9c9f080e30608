#include "streamfilt/core/TransformFactory.hpp"

#include <array>
#include <cstdint>
#include <limits>
#include <string>
#include <vector>

#include "streamfilt/core/Errors.hpp"
#include "streamfilt/core/KalmanFilter.hpp"
#include "streamfilt/core/Logger.hpp"

namespace streamfilt {

namespace {

std::string getString(const nlohmann::json& node, const std::string& key, const std::string& fallback) {
  if (!node.is_object()) {
    return fallback;
  }
  auto it = node.find(key);
  if (it == node.end() || !it->is_string()) {
    return fallback;
  }
  return it->get<std::string>();
}

int getInt(const nlohmann::json& node, const std::string& key, int fallback) {
  if (!node.is_object()) {
    return fallback;
  }
  auto it = node.find(key);
  if (it == node.end()) {
    return fallback;
  }
  if (!it->is_number_integer()) {
    throw ConfigurationError("TransformFactory: '" + key + "' must be an integer");
  }
  if (it->is_number_unsigned()) {
    if (it->get<std::uint64_t>() > static_cast<std::uint64_t>(std::numeric_limits<int>::max())) {
      throw ConfigurationError("TransformFactory: '" + key + "' is out of range");
    }
    return static_cast<int>(it->get<std::uint64_t>());
  }
  const std::int64_t value = it->get<std::int64_t>();
  if (value < std::numeric_limits<int>::min() || value > std::numeric_limits<int>::max()) {
    throw ConfigurationError("TransformFactory: '" + key + "' is out of range");
  }
  return static_cast<int>(value);
}

double getDouble(const nlohmann::json& node, const std::string& key, double fallback) {
  if (!node.is_object()) {
    return fallback;
  }
  auto it = node.find(key);
  if (it == node.end()) {
    return fallback;
  }
  if (!it->is_number()) {
    throw ConfigurationError("TransformFactory: '" + key + "' must be a number");
  }
  return it->get<double>();
}

std::vector<double> parseRealSequence(const nlohmann::json& node, const std::string& name) {
  if (!node.is_array()) {
    throw ConfigurationError("TransformFactory: '" + name + "' must be an array of numbers");
  }
  std::vector<double> values;
  values.reserve(node.size());
  for (const auto& item : node) {
    if (!item.is_number()) {
      throw ConfigurationError("TransformFactory: '" + name + "' must be an array of numbers");
    }
    values.push_back(item.get<double>());
  }
  return values;
}

Matrix parseMatrix(const nlohmann::json& node, const std::string& name) {
  if (!node.is_array() || node.empty()) {
    throw ConfigurationError("TransformFactory: '" + name + "' must be a non-empty array of rows");
  }
  const int rows = static_cast<int>(node.size());
  const int cols = node.front().is_array() ? static_cast<int>(node.front().size()) : 0;
  Matrix matrix = Matrix::Zero(rows, cols);
  for (int r = 0; r < rows; ++r) {
    const std::vector<double> row = parseRealSequence(node[static_cast<std::size_t>(r)], name);
    if (static_cast<int>(row.size()) != cols) {
      throw ConfigurationError("TransformFactory: '" + name + "' has ragged rows");
    }
    for (int c = 0; c < cols; ++c) {
      matrix(r, c) = row[c];
    }
  }
  return matrix;
}

Vector parseVector(const nlohmann::json& node, const std::string& name) {
  const std::vector<double> values = parseRealSequence(node, name);
  Vector vector(static_cast<Eigen::Index>(values.size()));
  for (std::size_t i = 0; i < values.size(); ++i) {
    vector(static_cast<Eigen::Index>(i)) = values[i];
  }
  return vector;
}

// Accepts a matrix or a scalar that multiplies identity(dim).
Matrix parseNoise(const nlohmann::json& node, int dim, const std::string& name) {
  if (node.is_number()) {
    return Matrix::Identity(dim, dim) * node.get<double>();
  }
  return parseMatrix(node, name);
}

std::shared_ptr<StreamingIirFilter> createIirFilter(const nlohmann::json& params) {
  const int bufferSize = getInt(params, "bufferSize", static_cast<int>(StreamingIirFilter::kDefaultBufferSize));
  if (bufferSize <= 0) {
    throw ConfigurationError("TransformFactory: 'bufferSize' must be positive");
  }
  const int axis = getInt(params, "axis", 0);
  return std::make_shared<StreamingIirFilter>(parseCoefficients(params), static_cast<std::size_t>(bufferSize), axis);
}

std::shared_ptr<LinearKalmanFilter> createKalmanFilter(const nlohmann::json& params) {
  if (!params.is_object() || !params.contains("dimState")) {
    throw ConfigurationError("TransformFactory: kalman params need 'dimState'");
  }
  const int dimState = getInt(params, "dimState", 0);
  const int dimMeasurement = getInt(params, "dimMeasurement", dimState);
  const int dimControl = getInt(params, "dimControl", 0);
  auto filter = std::make_shared<LinearKalmanFilter>(dimState, dimMeasurement, dimControl);

  filter->setAlpha(getDouble(params, "alpha", 1.0));
  if (params.contains("initialState")) {
    filter->initialize(parseVector(params["initialState"], "initialState"));
  }
  if (params.contains("covariance")) {
    filter->setCovariance(parseNoise(params["covariance"], dimState, "covariance"));
  }
  if (params.contains("stateTransition")) {
    filter->setStateTransition(parseMatrix(params["stateTransition"], "stateTransition"));
  }
  if (params.contains("controlTransition")) {
    filter->setControlTransition(parseMatrix(params["controlTransition"], "controlTransition"));
  }
  if (params.contains("measurementFunction")) {
    filter->setMeasurementFunction(parseMatrix(params["measurementFunction"], "measurementFunction"));
  }
  if (params.contains("processNoise")) {
    filter->setProcessNoise(parseNoise(params["processNoise"], dimState, "processNoise"));
  }
  if (params.contains("measurementNoise")) {
    filter->setMeasurementNoise(parseNoise(params["measurementNoise"], dimMeasurement, "measurementNoise"));
  }
  if (params.contains("processMeasurementCrossCorrelation")) {
    filter->setProcessMeasurementCrossCorrelation(
        parseMatrix(params["processMeasurementCrossCorrelation"], "processMeasurementCrossCorrelation"));
  }
  return filter;
}

} // namespace

FilterCoefficients_t parseCoefficients(const nlohmann::json& params) {
  if (!params.is_object()) {
    throw ConfigurationError("TransformFactory: iir params must be an object");
  }
  const CoefficientForm_e form = parseCoefficientForm(getString(params, "form", "sos"));
  if (form == CoefficientForm_e::kTransferFunction) {
    if (!params.contains("b") || !params.contains("a")) {
      throw ConfigurationError("TransformFactory: 'ba' form needs 'b' and 'a'");
    }
    TransferFunction_t tf;
    tf.numerator = parseRealSequence(params["b"], "b");
    tf.denominator = parseRealSequence(params["a"], "a");
    return tf;
  }

  if (!params.contains("sos")) {
    throw ConfigurationError("TransformFactory: 'sos' form needs a 'sos' table");
  }
  const Matrix table = parseMatrix(params["sos"], "sos");
  if (table.cols() != 6) {
    throw ConfigurationError("TransformFactory: every 'sos' row needs 6 coefficients");
  }
  SecondOrderSections_t sos;
  for (Eigen::Index r = 0; r < table.rows(); ++r) {
    std::array<double, 6> section{};
    for (Eigen::Index c = 0; c < 6; ++c) {
      section[static_cast<std::size_t>(c)] = table(r, c);
    }
    sos.sections.push_back(section);
  }
  return sos;
}

std::shared_ptr<IStreamTransform> createTransform(const nlohmann::json& transformNode) {
  const std::string type = getString(transformNode, "type", "");
  const nlohmann::json params =
      transformNode.is_object() ? transformNode.value("params", nlohmann::json::object()) : nlohmann::json::object();

  try {
    if (type == "iir") {
      auto filter = createIirFilter(params);
      if (auto logger = Logger::Get()) {
        logger->info("TransformFactory: creating IIR filter.");
      }
      return filter;
    }
    if (type == "kalman") {
      auto filter = createKalmanFilter(params);
      if (auto logger = Logger::Get()) {
        logger->info("TransformFactory: creating Kalman filter.");
      }
      return filter;
    }
  } catch (const ConfigurationError& ex) {
    if (auto logger = Logger::Get()) {
      logger->error("TransformFactory: {}", ex.what());
    }
    throw;
  }

  if (auto logger = Logger::Get()) {
    logger->error("TransformFactory: unknown type '{}'.", type);
  }
  throw ConfigurationError("TransformFactory: unknown transform type '" + type + "'");
}

} // namespace streamfilt
