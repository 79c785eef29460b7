#include "metrics.hpp"

#include <cmath>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace dbforecast {

static constexpr double kNaN = std::numeric_limits<double>::quiet_NaN();

static void requireSameShape(const Eigen::MatrixXd& a, const Eigen::MatrixXd& b) {
  if (a.rows() != b.rows() || a.cols() != b.cols()) {
    std::ostringstream oss;
    oss << "shape mismatch: " << a.rows() << "x" << a.cols()
        << " vs " << b.rows() << "x" << b.cols();
    throw std::invalid_argument(oss.str());
  }
}

static bool validPair(double p, double t) {
  return !std::isnan(p) && !std::isnan(t);
}

double meanAbsoluteError(const Eigen::MatrixXd& pred, const Eigen::MatrixXd& target) {
  requireSameShape(pred, target);
  double sum = 0.0;
  Eigen::Index n = 0;
  for (Eigen::Index j = 0; j < pred.cols(); ++j) {
    for (Eigen::Index i = 0; i < pred.rows(); ++i) {
      if (!validPair(pred(i, j), target(i, j))) continue;
      sum += std::abs(pred(i, j) - target(i, j));
      ++n;
    }
  }
  return (n == 0) ? kNaN : sum / static_cast<double>(n);
}

double rootMeanSquaredError(const Eigen::MatrixXd& pred, const Eigen::MatrixXd& target) {
  requireSameShape(pred, target);
  double sum2 = 0.0;
  Eigen::Index n = 0;
  for (Eigen::Index j = 0; j < pred.cols(); ++j) {
    for (Eigen::Index i = 0; i < pred.rows(); ++i) {
      if (!validPair(pred(i, j), target(i, j))) continue;
      const double d = pred(i, j) - target(i, j);
      sum2 += d * d;
      ++n;
    }
  }
  return (n == 0) ? kNaN : std::sqrt(sum2 / static_cast<double>(n));
}

Eigen::VectorXd meanAbsoluteErrorPerStation(const Eigen::MatrixXd& pred,
                                            const Eigen::MatrixXd& target) {
  requireSameShape(pred, target);
  Eigen::VectorXd out(pred.cols());
  for (Eigen::Index j = 0; j < pred.cols(); ++j) {
    double sum = 0.0;
    Eigen::Index n = 0;
    for (Eigen::Index i = 0; i < pred.rows(); ++i) {
      if (!validPair(pred(i, j), target(i, j))) continue;
      sum += std::abs(pred(i, j) - target(i, j));
      ++n;
    }
    out(j) = (n == 0) ? kNaN : sum / static_cast<double>(n);
  }
  return out;
}

Eigen::MatrixXd horizontalMagnitude(const Eigen::MatrixXd& north, const Eigen::MatrixXd& east) {
  requireSameShape(north, east);
  // NaN in either operand propagates through the arithmetic.
  return (north.array().square() + east.array().square()).sqrt().matrix();
}

Eigen::Index validCount(const Eigen::MatrixXd& pred, const Eigen::MatrixXd& target) {
  requireSameShape(pred, target);
  Eigen::Index n = 0;
  for (Eigen::Index j = 0; j < pred.cols(); ++j) {
    for (Eigen::Index i = 0; i < pred.rows(); ++i) {
      if (validPair(pred(i, j), target(i, j))) ++n;
    }
  }
  return n;
}

}  // namespace dbforecast
