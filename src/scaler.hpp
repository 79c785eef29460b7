#pragma once

#include <Eigen/Dense>

#include <map>
#include <string>
#include <vector>

namespace dbforecast {

// Standardization parameters of one target component, fixed for a run.
struct Scaler {
  double mean = 0.0;
  double stddev = 1.0;
};

// values * stddev + mean, elementwise. NaN stays NaN.
Eigen::MatrixXd destandardize(const Eigen::MatrixXd& values, const Scaler& s);
Eigen::MatrixXd destandardize(const Eigen::MatrixXd& values, double mean, double stddev);

// (values - mean) / std
Eigen::MatrixXd standardize(const Eigen::MatrixXd& values, const Scaler& s);

class ScalerSet {
 public:
  // Text file with one "component mean std" entry per line.
  bool load(const std::string& file);

  void set(const std::string& component, const Scaler& s) { scalers_[component] = s; }
  bool contains(const std::string& component) const;

  // Throws std::out_of_range for an unknown component.
  const Scaler& at(const std::string& component) const;

  std::vector<std::string> components() const;

 private:
  std::map<std::string, Scaler> scalers_;
};

}  // namespace dbforecast
