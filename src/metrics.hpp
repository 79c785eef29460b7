#pragma once

#include <Eigen/Dense>

namespace dbforecast {

// NaN-aware error metrics. Entries where either side is NaN are skipped;
// a reduction with no valid entry yields NaN. Shapes must match
// (std::invalid_argument otherwise).
double meanAbsoluteError(const Eigen::MatrixXd& pred, const Eigen::MatrixXd& target);
double rootMeanSquaredError(const Eigen::MatrixXd& pred, const Eigen::MatrixXd& target);

// Column-wise MAE over time, one value per station.
Eigen::VectorXd meanAbsoluteErrorPerStation(const Eigen::MatrixXd& pred,
                                            const Eigen::MatrixXd& target);

// sqrt(north^2 + east^2), NaN where either component is NaN.
Eigen::MatrixXd horizontalMagnitude(const Eigen::MatrixXd& north, const Eigen::MatrixXd& east);

// Count of entries where neither input is NaN.
Eigen::Index validCount(const Eigen::MatrixXd& pred, const Eigen::MatrixXd& target);

}  // namespace dbforecast
