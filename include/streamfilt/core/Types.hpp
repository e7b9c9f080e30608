#pragma once

#include <Eigen/Dense>

namespace streamfilt {
using Vector = Eigen::VectorXd;
using Matrix = Eigen::MatrixXd;
} // namespace streamfilt
