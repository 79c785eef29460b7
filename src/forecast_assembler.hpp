#pragma once

#include <Eigen/Dense>

#include <cstddef>
#include <map>
#include <string>
#include <vector>

#include "contraction.hpp"
#include "pipeline_types.hpp"
#include "scaler.hpp"

namespace dbforecast {

struct ForecastConfig {
  int nmax = 12;
  std::size_t max_stations = 0;       // fixed station capacity per timestep
  Precision precision = Precision::Double;
  std::vector<std::string> components = {"dbn", "dbe"};
};

// Assembled series of one target component. Rows are global timesteps in
// source order; columns are station slots (NaN where a slot has no data).
struct ComponentSeries {
  Eigen::MatrixXd predictions;    // [N, S_max] nT
  Eigen::MatrixXd targets;        // [N, S_max] nT
  Eigen::MatrixXd azimuth;        // [N, S_max] rad ("MLT")
  Eigen::MatrixXd polar;          // [N, S_max] rad ("colatitude")
  Eigen::MatrixXd coefficients;   // [N, B]
  std::vector<double> times;      // Julian dates, size N

  std::size_t steps() const { return times.size(); }
};

using ForecastResult = std::map<std::string, ComponentSeries>;

class ForecastAssembler {
 public:
  // Throws std::invalid_argument if the config is unusable or a component has no scaler.
  ForecastAssembler(ForecastConfig config, ScalerSet scalers);

  // Drive the model over every batch of `source` (after reset()) in source order.
  ForecastResult run(DataSource& source, InferenceModel& model) const;

  const ForecastConfig& config() const { return config_; }
  int basisWidth() const { return basis_width_; }

 private:
  ForecastConfig config_;
  ScalerSet scalers_;
  int basis_width_ = 0;

  // Per-batch blocks of one component, stacked once the source is exhausted.
  struct SeriesParts;

  void appendBatch(const Prediction& pred, std::size_t batch_index,
                   std::map<std::string, SeriesParts>& parts) const;
};

}  // namespace dbforecast
