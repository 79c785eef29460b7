#pragma once

#include <Eigen/Dense>

#include <map>
#include <string>
#include <vector>

#include "pipeline_types.hpp"

namespace dbforecast {

// Replays coefficient vectors computed offline by an external network.
// File format, one vector per line:
//   <component> <ISO timestamp> <c0> <c1> ... <c(B-1)>
// Timesteps without a stored vector get a NaN row.
class ReplayModel : public InferenceModel {
 public:
  explicit ReplayModel(int basis_width) : basis_width_(basis_width) {}

  bool load(const std::string& file);

  void add(const std::string& component, double jd, const Eigen::RowVectorXd& coefficients);

  std::string name() const override { return "replay"; }
  Prediction predict(const Batch& batch) override;

  std::vector<std::string> components() const;

 private:
  int basis_width_ = 0;
  // component -> (time key -> coefficients)
  std::map<std::string, std::map<long long, Eigen::RowVectorXd>> table_;
};

// Linear readout of the solar-wind features:
//   coefficients[t] = W * solar_wind[t] + b   (per component)
// File format, one coefficient row per line:
//   <component> <row> <b> <w0> ... <w(F-1)>
class LinearModel : public InferenceModel {
 public:
  explicit LinearModel(int basis_width) : basis_width_(basis_width) {}

  bool load(const std::string& file);

  // W: [B, F], b: [B]. Throws std::invalid_argument on shape mismatch.
  void set(const std::string& component, const Eigen::MatrixXd& W, const Eigen::VectorXd& b);

  std::string name() const override { return "linear"; }
  Prediction predict(const Batch& batch) override;

  std::vector<std::string> components() const;

 private:
  struct Readout {
    Eigen::MatrixXd W;
    Eigen::VectorXd b;
  };

  int basis_width_ = 0;
  std::map<std::string, Readout> readouts_;
};

}  // namespace dbforecast
